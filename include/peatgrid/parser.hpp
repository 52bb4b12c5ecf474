#pragma once

#include "peatgrid/types.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>

namespace peatgrid {

    // Reads a GeoJSON FeatureCollection, Feature or bare geometry. Multi-part geometries become one
    // feature per part. Throws SourceUnavailable when the file cannot be read or parsed.
    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file);

    FeatureCollection ParseFeatureCollection(const std::string &text);

    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc);

} // namespace peatgrid
