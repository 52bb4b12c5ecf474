#pragma once

#include "peatgrid/feedback.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace peatgrid {

    using Parameters = std::unordered_map<std::string, std::string>;
    using Outputs = std::unordered_map<std::string, std::string>;

    enum class ParameterType {
        PolygonSource,
        LineSource,
        MultiplePolygonSources,
        Boolean,
        Number,
        PointSink,
        PolygonSink
    };

    struct ParameterDefinition {
        std::string name;
        std::string description;
        ParameterType type;
        bool optional = false;
        std::string default_value;
    };

    struct AlgorithmDescription {
        std::string id;
        std::string display_name;
        std::string help;
    };

    class Algorithm {
      public:
        virtual ~Algorithm() = default;

        virtual AlgorithmDescription describe() const = 0;
        virtual std::vector<ParameterDefinition> declareInputs() const = 0;
        virtual Outputs run(const Parameters &parameters, Feedback &feedback) const = 0;
    };

    // Lookup helpers. Missing required values fall back to the declared default and throw
    // InvalidParameter when there is none.
    std::string parameterAsString(const Parameters &parameters, const ParameterDefinition &definition);
    bool parameterAsBool(const Parameters &parameters, const ParameterDefinition &definition);
    double parameterAsDouble(const Parameters &parameters, const ParameterDefinition &definition);
    std::vector<std::filesystem::path> parameterAsPathList(const Parameters &parameters,
                                                           const ParameterDefinition &definition);

    bool parseBool(const std::string &text);

} // namespace peatgrid
