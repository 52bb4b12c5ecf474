#include "peatgrid/geometry.hpp"
#include "peatgrid/error.hpp"

#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/algorithms/is_empty.hpp>
#include <boost/geometry/io/wkt/wkt.hpp>

#include <cmath>
#include <sstream>

namespace peatgrid {

    namespace {
        // 2^63, the first double past the int64 range
        constexpr double INT64_BOUND = 9223372036854775808.0;

        bool fitsInt64(double v) { return std::isfinite(v) && v >= -INT64_BOUND && v < INT64_BOUND; }
    } // namespace

    std::optional<BoundingBox> boundingBox(const Polygon &polygon) {
        if (bg::is_empty(polygon)) {
            return std::nullopt;
        }

        Box box;
        bg::envelope(polygon, box);

        const double x_min = bg::get<bg::min_corner, 0>(box);
        const double y_min = bg::get<bg::min_corner, 1>(box);
        const double x_max = bg::get<bg::max_corner, 0>(box);
        const double y_max = bg::get<bg::max_corner, 1>(box);
        if (!fitsInt64(x_min) || !fitsInt64(y_min) || !fitsInt64(x_max) || !fitsInt64(y_max)) {
            return std::nullopt;
        }

        // static_cast truncates toward zero
        return BoundingBox{static_cast<std::int64_t>(x_min), static_cast<std::int64_t>(y_min),
                           static_cast<std::int64_t>(x_max), static_cast<std::int64_t>(y_max)};
    }

    std::int64_t roundUpToMultiple(std::int64_t value, std::int64_t step) {
        const std::int64_t remainder = ((value % step) + step) % step;
        if (remainder == 0) {
            return value;
        }
        return value + step - remainder;
    }

    bool strictlyWithin(std::int64_t x, std::int64_t y, const Polygon &polygon) {
        const Point candidate{static_cast<double>(x), static_cast<double>(y), 0.0};
        return bg::within(candidate, polygon);
    }

    void normalize(Polygon &polygon) { bg::correct(polygon); }

    void normalize(MultiPolygon &polygons) { bg::correct(polygons); }

    Polygon polygonFromWkt(const std::string &wkt) {
        Polygon polygon;
        try {
            bg::read_wkt(wkt, polygon);
        } catch (const bg::read_wkt_exception &e) {
            throw SourceUnavailable(std::string("polygonFromWkt(): ") + e.what());
        }
        normalize(polygon);
        return polygon;
    }

    std::string toWkt(const Polygon &polygon) {
        std::ostringstream oss;
        oss << bg::wkt(polygon);
        return oss.str();
    }

    double area(const Polygon &polygon) { return bg::area(polygon); }

    double area(const MultiPolygon &polygons) { return bg::area(polygons); }

} // namespace peatgrid
