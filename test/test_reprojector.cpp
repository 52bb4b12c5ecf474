#include <doctest/doctest.h>

#include "peatgrid/error.hpp"
#include "peatgrid/crs_transformer.hpp"
#include "peatgrid/reprojector.hpp"

#include <cmath>
#include <variant>

namespace {
    peatgrid::FeatureCollection singlePolygonLayer(const std::string &wkt, std::optional<peatgrid::CRS> crs) {
        peatgrid::FeatureCollection fc;
        fc.crs = crs;
        if (crs)
            fc.crs_identifier = peatgrid::crsName(*crs);
        fc.features.push_back(peatgrid::Feature{peatgrid::polygonFromWkt(wkt), {{"name", "site"}}});
        return fc;
    }
} // namespace

TEST_CASE("Reprojector - Layer already on the National Grid is unchanged") {
    auto layer = singlePolygonLayer("POLYGON((412000 301000,412000 301500,412600 301500,412600 301000,412000 301000))",
                                    peatgrid::CRS::BNG);
    peatgrid::Reprojector reprojector;
    auto out = reprojector.reproject(layer);

    REQUIRE(out.features.size() == 1);
    const auto &before = std::get<peatgrid::Polygon>(layer.features[0].geometry);
    const auto &after = std::get<peatgrid::Polygon>(out.features[0].geometry);
    REQUIRE(after.outer().size() == before.outer().size());
    for (std::size_t i = 0; i < before.outer().size(); ++i) {
        CHECK(after.outer()[i].x == before.outer()[i].x);
        CHECK(after.outer()[i].y == before.outer()[i].y);
    }
    CHECK(out.features[0].properties.at("name") == "site");
}

TEST_CASE("Reprojector - WGS84 layer") {
    // lon/lat around Westminster
    auto layer = singlePolygonLayer("POLYGON((-0.1250 51.5000,-0.1250 51.5010,-0.1240 51.5010,-0.1240 51.5000,"
                                    "-0.1250 51.5000),(-0.1247 51.5003,-0.1243 51.5003,-0.1243 51.5007,"
                                    "-0.1247 51.5007,-0.1247 51.5003))",
                                    peatgrid::CRS::WGS);
    peatgrid::Reprojector reprojector;
    auto out = reprojector.reproject(layer);

    CHECK(out.crs == peatgrid::CRS::BNG);
    CHECK(out.crs_identifier == "EPSG:27700");
    REQUIRE(out.features.size() == 1);
    const auto &poly = std::get<peatgrid::Polygon>(out.features[0].geometry);
    REQUIRE(poly.inners().size() == 1);

    for (const auto &p : poly.outer()) {
        CHECK(p.x > 529000.0);
        CHECK(p.x < 531000.0);
        CHECK(p.y > 178500.0);
        CHECK(p.y < 180500.0);
    }

    auto expected = peatgrid::CrsTransformer("EPSG:4326", "EPSG:27700").forward(dp::Point{-0.1250, 51.5000, 0.0});
    bool found = false;
    for (const auto &p : poly.outer()) {
        if (std::abs(p.x - expected.x) < 1e-6 && std::abs(p.y - expected.y) < 1e-6)
            found = true;
    }
    CHECK(found);

    // ~70m x ~111m in metres now
    CHECK(peatgrid::area(poly) > 5000.0);
    CHECK(peatgrid::area(poly) < 9000.0);
}

TEST_CASE("Reprojector - ENU layer goes through WGS84") {
    dp::Geo datum{55.0, -4.0, 0.0};
    concord::earth::WGS wgs{55.001, -3.999, 0.0};
    auto enu = concord::frame::to_enu(datum, wgs);

    peatgrid::Reprojector reprojector;
    auto grid = reprojector.reprojectPoint(dp::Point{enu.east(), enu.north(), enu.up()}, peatgrid::CRS::ENU, datum);
    auto direct = peatgrid::CrsTransformer("EPSG:4326", "EPSG:27700").forward(dp::Point{-3.999, 55.001, 0.0});
    CHECK(std::abs(grid.x - direct.x) < 0.01);
    CHECK(std::abs(grid.y - direct.y) < 0.01);
}

TEST_CASE("Reprojector - Layers declared in other reference systems") {
    // the same field corner, 54.5N 3.2W, written in each system
    peatgrid::Reprojector reprojector;
    auto via_wgs = reprojector.reprojectPoint(dp::Point{-3.2, 54.5, 0.0}, peatgrid::CRS::WGS, dp::Geo{0.0, 0.0, 0.0});

    auto expectCorner = [&](const std::string &identifier, const dp::Point &corner) {
        peatgrid::FeatureCollection layer;
        layer.crs_identifier = identifier;
        layer.features.push_back(peatgrid::Feature{corner, {{"name", "corner"}}});

        auto out = reprojector.reproject(layer);
        CHECK(out.crs == peatgrid::CRS::BNG);
        CHECK(out.crs_identifier == "EPSG:27700");
        REQUIRE(out.features.size() == 1);
        CHECK(out.features[0].properties.at("name") == "corner");
        const auto &grid = std::get<dp::Point>(out.features[0].geometry);
        CHECK(std::abs(grid.x - via_wgs.x) < 5.0);
        CHECK(std::abs(grid.y - via_wgs.y) < 5.0);
    };

    SUBCASE("ETRS89") { expectCorner("EPSG:4258", dp::Point{-3.2, 54.5, 0.0}); }
    SUBCASE("Web Mercator") { expectCorner("EPSG:3857", dp::Point{-356222.371, 7265424.819, 0.0}); }
    SUBCASE("Web Mercator as an OGC urn") {
        expectCorner("urn:ogc:def:crs:EPSG::3857", dp::Point{-356222.371, 7265424.819, 0.0});
    }
    SUBCASE("UTM zone 30N") { expectCorner("EPSG:32630", dp::Point{487047.702, 6039172.630, 0.0}); }

    SUBCASE("Polygons keep their holes") {
        peatgrid::FeatureCollection layer;
        layer.crs_identifier = "EPSG:32630";
        layer.features.push_back(peatgrid::Feature{
            peatgrid::polygonFromWkt("POLYGON((487000 6039000,487000 6039400,487400 6039400,487400 6039000,"
                                     "487000 6039000),(487100 6039100,487300 6039100,487300 6039300,"
                                     "487100 6039300,487100 6039100))"),
            {}});
        auto out = reprojector.reproject(layer);
        const auto &poly = std::get<peatgrid::Polygon>(out.features[0].geometry);
        CHECK(poly.inners().size() == 1);
        // UTM and National Grid scales differ by well under 0.1% here
        CHECK(peatgrid::area(poly) == doctest::Approx(120000.0).epsilon(0.002));
    }
}

TEST_CASE("Reprojector - Failures") {
    peatgrid::Reprojector reprojector;

    SUBCASE("No declared reference system") {
        auto layer = singlePolygonLayer("POLYGON((0 0,0 1,1 1,1 0,0 0))", std::nullopt);
        CHECK_THROWS_AS(reprojector.reproject(layer), peatgrid::ReprojectionFailure);
    }

    SUBCASE("Unsupported reference system") {
        auto layer = singlePolygonLayer("POLYGON((0 0,0 1,1 1,1 0,0 0))", std::nullopt);
        layer.crs_identifier = "EPSG:999999";
        CHECK_THROWS_WITH_AS(reprojector.reproject(layer), "Reprojector: unsupported reference system 'EPSG:999999'",
                             peatgrid::ReprojectionFailure);
    }

    SUBCASE("Coordinates outside the valid range") {
        auto layer = singlePolygonLayer("POLYGON((0 95,0 96,1 96,1 95,0 95))", peatgrid::CRS::WGS);
        CHECK_THROWS_AS(reprojector.reproject(layer), peatgrid::ReprojectionFailure);
    }

    SUBCASE("A failing layer leaves other layers untouched") {
        auto good = singlePolygonLayer("POLYGON((-2 54,-2 54.01,-1.99 54.01,-1.99 54,-2 54))", peatgrid::CRS::WGS);
        auto bad = singlePolygonLayer("POLYGON((0 0,0 1,1 1,1 0,0 0))", std::nullopt);

        auto good_bng = reprojector.reproject(good);
        CHECK_THROWS_AS(reprojector.reproject(bad), peatgrid::ReprojectionFailure);
        auto again = reprojector.reproject(good);
        CHECK(peatgrid::toWkt(std::get<peatgrid::Polygon>(again.features[0].geometry)) ==
              peatgrid::toWkt(std::get<peatgrid::Polygon>(good_bng.features[0].geometry)));
    }
}
