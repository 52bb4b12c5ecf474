#include "peatgrid/writer.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/logging.hpp"

#include <boost/json.hpp>
#include <fstream>
#include <system_error>

namespace peatgrid {

    namespace {
        boost::json::array ptCoords(Point const &p) {
            boost::json::array arr;
            arr.push_back(p.x);
            arr.push_back(p.y);
            return arr;
        }

        template <typename Range> boost::json::array rangeCoords(Range const &range) {
            boost::json::array arr;
            for (auto const &p : range)
                arr.push_back(ptCoords(p));
            return arr;
        }

        template <typename T> boost::json::value nullable(std::optional<T> const &v) {
            if (!v)
                return nullptr;
            return boost::json::value_from(*v);
        }
    } // namespace

    boost::json::value geometryToJson(Geometry const &geom) {
        return std::visit(
            [&](auto const &shape) -> boost::json::value {
                using T = std::decay_t<decltype(shape)>;
                boost::json::object j;
                if constexpr (std::is_same_v<T, Point>) {
                    j["type"] = "Point";
                    j["coordinates"] = ptCoords(shape);
                } else if constexpr (std::is_same_v<T, LineString>) {
                    j["type"] = "LineString";
                    j["coordinates"] = rangeCoords(shape);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    j["type"] = "Polygon";
                    boost::json::array rings;
                    rings.push_back(rangeCoords(shape.outer()));
                    for (auto const &inner : shape.inners())
                        rings.push_back(rangeCoords(inner));
                    j["coordinates"] = std::move(rings);
                }
                return j;
            },
            geom);
    }

    boost::json::value featureToJson(Feature const &f) {
        boost::json::object j;
        j["type"] = "Feature";
        boost::json::object props;
        for (auto const &kv : f.properties)
            props[kv.first] = kv.second;
        j["properties"] = std::move(props);
        j["geometry"] = geometryToJson(f.geometry);
        return j;
    }

    boost::json::value samplePointToJson(SamplePoint const &point) {
        boost::json::object props;
        props["record_id"] = point.record_id;
        props["easting"] = point.easting;
        props["northing"] = point.northing;
        props["date"] = nullable(point.date);
        props["spacing"] = point.spacing;
        props["peat_depth"] = nullable(point.peat_depth);
        props["main_con"] = nullable(point.main_con);
        props["sub_con"] = nullable(point.sub_con);
        props["notes"] = nullable(point.notes);
        props["photo"] = nullable(point.photo);

        boost::json::object j;
        j["type"] = "Feature";
        j["properties"] = std::move(props);
        j["geometry"] = geometryToJson(Point{static_cast<double>(point.easting),
                                             static_cast<double>(point.northing), 0.0});
        return j;
    }

    boost::json::object crsToJson(CRS crs) {
        boost::json::object named;
        named["type"] = "name";
        boost::json::object props;
        switch (crs) {
        case CRS::WGS:
            props["name"] = "urn:ogc:def:crs:OGC:1.3:CRS84";
            break;
        case CRS::BNG:
            props["name"] = "urn:ogc:def:crs:EPSG::27700";
            break;
        case CRS::ENU:
            props["name"] = "ENU";
            break;
        }
        named["properties"] = std::move(props);
        return named;
    }

    boost::json::value toJson(FeatureCollection const &fc) {
        boost::json::object j;
        j["type"] = "FeatureCollection";
        if (fc.crs)
            j["crs"] = crsToJson(*fc.crs);

        {
            boost::json::object P;

            if (fc.crs)
                P["crs"] = crsName(*fc.crs);
            else if (!fc.crs_identifier.empty())
                P["crs"] = fc.crs_identifier;

            boost::json::array datum_arr;
            datum_arr.push_back(fc.datum.longitude);
            datum_arr.push_back(fc.datum.latitude);
            datum_arr.push_back(fc.datum.altitude);
            P["datum"] = std::move(datum_arr);

            P["heading"] = fc.heading.yaw;

            for (const auto &[key, value] : fc.global_properties) {
                P[key] = value;
            }

            j["properties"] = std::move(P);
        }

        boost::json::array features;
        for (auto const &f : fc.features)
            features.push_back(featureToJson(f));
        j["features"] = std::move(features);

        return j;
    }

    void WriteFeatureCollection(FeatureCollection const &fc, std::filesystem::path const &outPath) {
        auto j = toJson(fc);
        const std::filesystem::path partial = outPath.string() + ".partial";

        auto discard = [&partial]() {
            std::error_code ec;
            std::filesystem::remove(partial, ec);
            if (ec)
                logger()->warn("could not remove partial output {}: {}", partial.string(), ec.message());
        };

        {
            std::ofstream ofs(partial);
            if (!ofs)
                throw SinkUnavailable("Cannot open for write: " + partial.string());
            ofs << boost::json::serialize(j) << "\n";
            ofs.close();
            if (ofs.fail()) {
                discard();
                throw SinkUnavailable("Failed writing " + partial.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(partial, outPath, ec);
        if (ec) {
            discard();
            throw SinkUnavailable("Cannot move output into place at " + outPath.string() + ": " + ec.message());
        }
    }

} // namespace peatgrid
