#pragma once

#include <datapod/datapod.hpp>

#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/within.hpp>
#include <boost/geometry/core/cs.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include <boost/geometry/geometries/ring.hpp>

#include <cstdint>
#include <optional>
#include <string>

// datapod::Point carries x, y, z; only the planar part takes part in polygon algebra.
BOOST_GEOMETRY_REGISTER_POINT_2D(::datapod::Point, double, boost::geometry::cs::cartesian, x, y)

namespace dp = ::datapod;

namespace peatgrid {

    namespace bg = boost::geometry;

    using Point = dp::Point;
    using LineString = bg::model::linestring<Point>;
    using MultiLineString = bg::model::multi_linestring<LineString>;
    using Ring = bg::model::ring<Point>;
    using Polygon = bg::model::polygon<Point>;
    using MultiPolygon = bg::model::multi_polygon<Polygon>;
    using Box = bg::model::box<Point>;

    // Integer bounds of a polygon, each component truncated toward zero.
    struct BoundingBox {
        std::int64_t x_min;
        std::int64_t y_min;
        std::int64_t x_max;
        std::int64_t y_max;
    };

    // Returns std::nullopt for an empty polygon or one whose bounds are non-finite or outside the int64 range.
    std::optional<BoundingBox> boundingBox(const Polygon &polygon);

    // Smallest multiple of step that is >= value. Multiples are returned unchanged.
    std::int64_t roundUpToMultiple(std::int64_t value, std::int64_t step);

    // Interior test that rejects points lying on any ring of the polygon.
    bool strictlyWithin(std::int64_t x, std::int64_t y, const Polygon &polygon);

    // Fixes ring orientation and closure in place.
    void normalize(Polygon &polygon);
    void normalize(MultiPolygon &polygons);

    Polygon polygonFromWkt(const std::string &wkt);
    std::string toWkt(const Polygon &polygon);

    double area(const Polygon &polygon);
    double area(const MultiPolygon &polygons);

} // namespace peatgrid
