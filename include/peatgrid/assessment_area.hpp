#pragma once

#include "peatgrid/algorithm.hpp"
#include "peatgrid/reprojector.hpp"
#include "peatgrid/types.hpp"

#include <optional>
#include <vector>

namespace peatgrid {

    inline constexpr double DEFAULT_WATERCOURSE_BUFFER = 30.0;

    // Polygon parts of a layer as one set, overlaps dissolved.
    MultiPolygon mergePolygons(const std::vector<FeatureCollection> &bng_layers);

    // Dissolved corridor of the given half-width around every line of the layer.
    MultiPolygon bufferLines(const FeatureCollection &bng_layer, double distance, int points_per_circle = 36);

    // Net assessable area: site minus non-peatland cover minus the buffered watercourse corridor. Each layer
    // is reprojected on its own before any polygon algebra.
    MultiPolygon netAssessableArea(const FeatureCollection &site, const std::optional<FeatureCollection> &watercourses,
                                   const std::vector<FeatureCollection> &non_peatland, const Reprojector &reprojector,
                                   double buffer_distance = DEFAULT_WATERCOURSE_BUFFER);

    FeatureCollection toFeatureCollection(const MultiPolygon &area, const Properties &properties = {});

    // "Peatland code assessment unit base", following the Peatland Code field protocol v2.0 (March 2023).
    class PeatlandCodeAssessmentBase : public Algorithm {
      public:
        static constexpr const char *INPUT = "INPUT";
        static constexpr const char *WATER_COURSE = "WATER_COURSE";
        static constexpr const char *NON_PEATLAND = "NON_PEATLAND";
        static constexpr const char *BUFFER_DISTANCE = "BUFFER_DISTANCE";
        static constexpr const char *OUTPUT = "OUTPUT";

        AlgorithmDescription describe() const override;
        std::vector<ParameterDefinition> declareInputs() const override;
        Outputs run(const Parameters &parameters, Feedback &feedback) const override;
    };

} // namespace peatgrid
