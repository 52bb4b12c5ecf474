#include <doctest/doctest.h>

#include "peatgrid/peatgrid.hpp"
#include <filesystem>
#include <memory>

namespace {
    peatgrid::SamplePoint makePoint(std::int64_t id, std::int64_t e, std::int64_t n) {
        peatgrid::SamplePoint p;
        p.record_id = id;
        p.easting = e;
        p.northing = n;
        p.spacing = 100;
        return p;
    }
} // namespace

TEST_CASE("Sink - Memory sink keeps points in order") {
    peatgrid::MemoryPointSink sink;
    sink.addPoint(makePoint(1, 100, 100));
    sink.addPoint(makePoint(2, 200, 100));
    CHECK_FALSE(sink.committed());
    sink.commit();

    CHECK(sink.committed());
    REQUIRE(sink.points().size() == 2);
    CHECK(sink.points()[0].record_id == 1);
    CHECK(sink.points()[1].easting == 200);
}

TEST_CASE("Sink - GeoJSON sink") {
    const std::filesystem::path out = "/tmp/peatgrid_test_sink.geojson";
    const std::filesystem::path partial = "/tmp/peatgrid_test_sink.geojson.partial";
    std::filesystem::remove(out);
    std::filesystem::remove(partial);

    SUBCASE("Committed output is a readable National Grid layer") {
        {
            peatgrid::GeoJsonPointSink sink(out);
            CHECK(std::filesystem::exists(partial));
            CHECK_FALSE(std::filesystem::exists(out));
            sink.addPoint(makePoint(1, 412300, 301200));
            sink.addPoint(makePoint(2, 412400, 301200));
            sink.addPoint(makePoint(3, 412300, 301300));
            CHECK(sink.count() == 3);
            sink.commit();
        }
        CHECK(std::filesystem::exists(out));
        CHECK_FALSE(std::filesystem::exists(partial));

        auto fc = peatgrid::ReadFeatureCollection(out);
        CHECK(fc.crs == peatgrid::CRS::BNG);
        REQUIRE(fc.features.size() == 3);
        auto *pt = std::get_if<dp::Point>(&fc.features[1].geometry);
        REQUIRE(pt != nullptr);
        CHECK(pt->x == doctest::Approx(412400.0));
        CHECK(pt->y == doctest::Approx(301200.0));
        CHECK(fc.features[1].properties.at("record_id") == "2");
        CHECK(fc.features[1].properties.at("spacing") == "100");
        CHECK(fc.features[1].properties.at("peat_depth") == "null");
    }

    SUBCASE("Empty output is still a valid collection") {
        {
            peatgrid::GeoJsonPointSink sink(out);
            sink.commit();
        }
        auto fc = peatgrid::ReadFeatureCollection(out);
        CHECK(fc.crs == peatgrid::CRS::BNG);
        CHECK(fc.features.empty());
    }

    SUBCASE("Abandoned output leaves nothing behind") {
        {
            auto sink = std::make_unique<peatgrid::GeoJsonPointSink>(out);
            sink->addPoint(makePoint(1, 100, 100));
        }
        CHECK_FALSE(std::filesystem::exists(out));
        CHECK_FALSE(std::filesystem::exists(partial));
    }

    SUBCASE("No points after commit") {
        peatgrid::GeoJsonPointSink sink(out);
        sink.commit();
        CHECK_THROWS_AS(sink.addPoint(makePoint(1, 100, 100)), peatgrid::SinkUnavailable);
    }

    std::filesystem::remove(out);
    std::filesystem::remove(partial);
}

TEST_CASE("Sink - Missing output directory") {
    CHECK_THROWS_AS(peatgrid::GeoJsonPointSink("/nonexistent_dir_peatgrid/points.geojson"),
                    peatgrid::SinkUnavailable);
}
