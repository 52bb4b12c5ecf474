#include "peatgrid/algorithm.hpp"
#include "peatgrid/error.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace peatgrid {

    namespace {
        std::string trim(const std::string &s) {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }
    } // namespace

    bool parseBool(const std::string &text) {
        std::string s = trim(text);
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        if (s == "true" || s == "1" || s == "yes" || s == "on")
            return true;
        if (s == "false" || s == "0" || s == "no" || s == "off")
            return false;
        throw InvalidParameter("'" + text + "' is not a boolean");
    }

    std::string parameterAsString(const Parameters &parameters, const ParameterDefinition &definition) {
        auto it = parameters.find(definition.name);
        if (it != parameters.end() && !trim(it->second).empty())
            return trim(it->second);
        if (!definition.default_value.empty() || definition.optional)
            return definition.default_value;
        throw InvalidParameter("missing required parameter " + definition.name);
    }

    bool parameterAsBool(const Parameters &parameters, const ParameterDefinition &definition) {
        auto value = parameterAsString(parameters, definition);
        try {
            return parseBool(value);
        } catch (const InvalidParameter &e) {
            throw InvalidParameter(definition.name + ": " + e.what());
        }
    }

    double parameterAsDouble(const Parameters &parameters, const ParameterDefinition &definition) {
        auto value = parameterAsString(parameters, definition);
        std::size_t used = 0;
        double d = 0.0;
        try {
            d = std::stod(value, &used);
        } catch (const std::exception &) {
            throw InvalidParameter(definition.name + ": '" + value + "' is not a number");
        }
        if (used != value.size() || !std::isfinite(d))
            throw InvalidParameter(definition.name + ": '" + value + "' is not a number");
        return d;
    }

    std::vector<std::filesystem::path> parameterAsPathList(const Parameters &parameters,
                                                           const ParameterDefinition &definition) {
        std::vector<std::filesystem::path> paths;
        std::istringstream iss(parameterAsString(parameters, definition));
        std::string item;
        while (std::getline(iss, item, ';')) {
            item = trim(item);
            if (!item.empty())
                paths.emplace_back(item);
        }
        return paths;
    }

} // namespace peatgrid
