#include "peatgrid/reprojector.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/logging.hpp"

#include <cmath>
#include <optional>
#include <type_traits>

namespace peatgrid {

    namespace {
        template <typename PointFn> Geometry transformGeometry(const Geometry &geometry, const PointFn &fn) {
            return std::visit(
                [&](auto const &shape) -> Geometry {
                    using T = std::decay_t<decltype(shape)>;
                    T out = shape;
                    if constexpr (std::is_same_v<T, Point>) {
                        out = fn(shape);
                    } else if constexpr (std::is_same_v<T, LineString>) {
                        for (auto &p : out)
                            p = fn(p);
                    } else if constexpr (std::is_same_v<T, Polygon>) {
                        for (auto &p : out.outer())
                            p = fn(p);
                        for (auto &inner : out.inners()) {
                            for (auto &p : inner)
                                p = fn(p);
                        }
                        normalize(out);
                    }
                    return out;
                },
                geometry);
        }
    } // namespace

    Reprojector::Reprojector() : wgs_to_grid_(crsName(CRS::WGS), crsName(target())) {}

    Point Reprojector::reprojectPoint(const Point &point, CRS source, const dp::Geo &datum) const {
        switch (source) {
        case CRS::BNG:
            return point;
        case CRS::WGS:
            if (!std::isfinite(point.x) || !std::isfinite(point.y) || std::abs(point.y) > 90.0) {
                throw ReprojectionFailure("Reprojector: invalid WGS84 position (" + std::to_string(point.x) + ", " +
                                          std::to_string(point.y) + ")");
            }
            // GeoJSON order is lon, lat
            return wgs_to_grid_.forward(point);
        case CRS::ENU: {
            concord::frame::ENU enu{point, datum};
            auto wgs = concord::frame::to_wgs(enu);
            return reprojectPoint(Point{wgs.longitude, wgs.latitude, wgs.altitude}, CRS::WGS, datum);
        }
        }
        throw ReprojectionFailure("Reprojector: unsupported source reference system");
    }

    Geometry Reprojector::reproject(const Geometry &geometry, CRS source, const dp::Geo &datum) const {
        if (source == target()) {
            return geometry;
        }
        return transformGeometry(geometry, [&](const Point &p) { return reprojectPoint(p, source, datum); });
    }

    FeatureCollection Reprojector::reproject(const FeatureCollection &layer) const {
        if (layer.crs && *layer.crs == target()) {
            return layer;
        }
        if (!layer.crs && layer.crs_identifier.empty()) {
            throw ReprojectionFailure("Reprojector: layer declares no reference system, cannot transform to " +
                                      crsName(target()));
        }

        std::optional<CrsTransformer> declared;
        if (!layer.crs) {
            try {
                declared.emplace(layer.crs_identifier, crsName(target()));
            } catch (const ReprojectionFailure &e) {
                logger()->debug("{}", e.what());
                throw ReprojectionFailure("Reprojector: unsupported reference system '" + layer.crs_identifier +
                                          "'");
            }
        }

        FeatureCollection out;
        out.crs = target();
        out.crs_identifier = crsName(target());
        out.datum = layer.datum;
        out.heading = layer.heading;
        out.global_properties = layer.global_properties;
        out.features.reserve(layer.features.size());
        for (const auto &feature : layer.features) {
            if (declared) {
                out.features.push_back(Feature{
                    transformGeometry(feature.geometry, [&](const Point &p) { return declared->forward(p); }),
                    feature.properties});
            } else {
                out.features.push_back(
                    Feature{reproject(feature.geometry, *layer.crs, layer.datum), feature.properties});
            }
        }
        return out;
    }

} // namespace peatgrid
