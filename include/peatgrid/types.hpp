#pragma once

#include "peatgrid/geometry.hpp"

#include <concord/concord.hpp>
#include <datapod/datapod.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace peatgrid {

    // Coordinates are kept in the reference system the layer declares; Reprojector moves them to BNG.
    using Geometry = std::variant<Point, LineString, Polygon>;

    // Named systems. WGS: EPSG:4326 lon/lat, ENU: local frame around the layer datum, BNG: EPSG:27700.
    enum class CRS { WGS, ENU, BNG };

    using Properties = std::unordered_map<std::string, std::string>;

    struct Feature {
        Geometry geometry;
        Properties properties;
    };

    struct FeatureCollection {
        std::optional<CRS> crs;
        std::string crs_identifier; // as declared by the source, kept for diagnostics
        dp::Geo datum{0.0, 0.0, 0.0};
        dp::Euler heading{0.0, 0.0, 0.0};
        std::vector<Feature> features;
        Properties global_properties;
    };

    // Returns std::nullopt for identifiers outside the named systems; those are resolved by PROJ when reprojecting.
    std::optional<CRS> parseCrs(const std::string &identifier);

    // Canonical identifier written to output files.
    std::string crsName(CRS crs);

    // One survey location. The trailing fields are left empty for entry in the field.
    struct SamplePoint {
        std::int64_t record_id = 0;
        std::int64_t easting = 0;
        std::int64_t northing = 0;
        std::optional<std::string> date;
        std::int64_t spacing = 0;
        std::optional<std::int64_t> peat_depth;
        std::optional<std::string> main_con;
        std::optional<std::string> sub_con;
        std::optional<std::string> notes;
        std::optional<std::string> photo;
    };

    bool operator==(const SamplePoint &lhs, const SamplePoint &rhs);
    bool operator!=(const SamplePoint &lhs, const SamplePoint &rhs);

} // namespace peatgrid
