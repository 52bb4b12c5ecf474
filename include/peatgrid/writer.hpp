#pragma once

#include "peatgrid/types.hpp"

#include <boost/json/value.hpp>

#include <filesystem>

namespace peatgrid {

    boost::json::value geometryToJson(Geometry const &geom);

    boost::json::value featureToJson(Feature const &f);

    // Point feature carrying the full survey attribute schema; unset fields are written as null.
    boost::json::value samplePointToJson(SamplePoint const &point);

    boost::json::object crsToJson(CRS crs);

    boost::json::value toJson(FeatureCollection const &fc);

    // Writes "<outPath>.partial" and renames it into place, so a failed write never leaves a truncated
    // file at outPath. Throws SinkUnavailable when the file cannot be created or moved.
    void WriteFeatureCollection(FeatureCollection const &fc, std::filesystem::path const &outPath);

} // namespace peatgrid
