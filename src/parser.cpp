#include "peatgrid/parser.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/logging.hpp"

#include <boost/json.hpp>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <variant>
#include <vector>

namespace peatgrid {

    namespace op {
        // Wraps a Feature or bare geometry so callers only ever see a FeatureCollection.
        boost::json::value normalizeRoot(boost::json::value j) {
            if (!j.is_object() || !j.as_object().contains("type") || !j.as_object().at("type").is_string()) {
                throw SourceUnavailable(
                    "peatgrid::ReadFeatureCollection(): top-level object has no string 'type' field");
            }

            auto type = std::string(j.as_object().at("type").as_string());
            if (type == "FeatureCollection") {
                return j;
            }
            if (type == "Feature") {
                boost::json::object fc;
                fc["type"] = "FeatureCollection";
                boost::json::array features;
                features.push_back(std::move(j));
                fc["features"] = std::move(features);
                return fc;
            }

            boost::json::object feat;
            feat["type"] = "Feature";
            feat["geometry"] = std::move(j);
            feat["properties"] = boost::json::object();
            boost::json::object fc;
            fc["type"] = "FeatureCollection";
            boost::json::array features;
            features.push_back(std::move(feat));
            fc["features"] = std::move(features);
            return fc;
        }
    } // namespace op

    namespace {
        using json = boost::json::value;

        double toDouble(const json &v) {
            if (!v.is_number())
                throw SourceUnavailable("peatgrid::ReadFeatureCollection(): coordinate is not a number");
            return boost::json::value_to<double>(v);
        }

        Properties parseProperties(const json &props) {
            Properties m;
            if (!props.is_object())
                return m;
            auto const &obj = props.as_object();
            m.reserve(obj.size());
            for (auto const &item : obj) {
                if (item.value().is_string())
                    m[std::string(item.key())] = std::string(item.value().as_string());
                else
                    m[std::string(item.key())] = boost::json::serialize(item.value());
            }
            return m;
        }

        Point parsePoint(const json &coords) {
            auto const &arr = coords.as_array();
            if (arr.size() < 2)
                throw SourceUnavailable("peatgrid::ReadFeatureCollection(): position with fewer than 2 numbers");
            double z = arr.size() > 2 ? toDouble(arr.at(2)) : 0.0;
            return Point{toDouble(arr.at(0)), toDouble(arr.at(1)), z};
        }

        LineString parseLineString(const json &coords) {
            LineString line;
            for (auto const &c : coords.as_array())
                line.push_back(parsePoint(c));
            return line;
        }

        Polygon parsePolygon(const json &coords) {
            Polygon polygon;
            auto const &rings = coords.as_array();
            for (std::size_t i = 0; i < rings.size(); ++i) {
                Ring ring;
                for (auto const &c : rings[i].as_array())
                    ring.push_back(parsePoint(c));
                if (i == 0)
                    polygon.outer() = std::move(ring);
                else
                    polygon.inners().push_back(std::move(ring));
            }
            normalize(polygon);
            return polygon;
        }

        std::vector<Geometry> parseGeometry(const json &geom) {
            std::vector<Geometry> out;
            auto const &obj = geom.as_object();
            auto type = std::string(obj.at("type").as_string());

            if (type == "Point") {
                out.emplace_back(parsePoint(obj.at("coordinates")));
            } else if (type == "LineString") {
                out.emplace_back(parseLineString(obj.at("coordinates")));
            } else if (type == "Polygon") {
                out.emplace_back(parsePolygon(obj.at("coordinates")));
            } else if (type == "MultiPoint") {
                for (auto const &c : obj.at("coordinates").as_array())
                    out.emplace_back(parsePoint(c));
            } else if (type == "MultiLineString") {
                for (auto const &line : obj.at("coordinates").as_array())
                    out.emplace_back(parseLineString(line));
            } else if (type == "MultiPolygon") {
                for (auto const &poly : obj.at("coordinates").as_array())
                    out.emplace_back(parsePolygon(poly));
            } else if (type == "GeometryCollection") {
                for (auto const &sub : obj.at("geometries").as_array()) {
                    auto subs = parseGeometry(sub);
                    out.insert(out.end(), subs.begin(), subs.end());
                }
            } else {
                logger()->warn("skipping unsupported geometry type '{}'", type);
            }
            return out;
        }

        // properties.crs takes precedence over the GeoJSON 2008 named crs member.
        std::string declaredCrs(const boost::json::object &fc_obj) {
            if (fc_obj.contains("properties") && fc_obj.at("properties").is_object()) {
                auto const &P = fc_obj.at("properties").as_object();
                if (P.contains("crs") && P.at("crs").is_string())
                    return std::string(P.at("crs").as_string());
            }
            if (fc_obj.contains("crs") && fc_obj.at("crs").is_object()) {
                auto const &crs = fc_obj.at("crs").as_object();
                if (crs.contains("properties") && crs.at("properties").is_object()) {
                    auto const &cp = crs.at("properties").as_object();
                    if (cp.contains("name") && cp.at("name").is_string())
                        return std::string(cp.at("name").as_string());
                }
            }
            return "";
        }

        FeatureCollection buildCollection(const json &root) {
            auto fc_json = op::normalizeRoot(root);
            auto const &fc_obj = fc_json.as_object();

            FeatureCollection fc;
            fc.crs_identifier = declaredCrs(fc_obj);
            if (!fc.crs_identifier.empty()) {
                fc.crs = parseCrs(fc.crs_identifier);
                if (!fc.crs)
                    logger()->debug("reference system '{}' left to PROJ", fc.crs_identifier);
            }

            if (fc_obj.contains("properties") && fc_obj.at("properties").is_object()) {
                auto const &P = fc_obj.at("properties").as_object();

                // GeoJSON order: [longitude, latitude, altitude]
                if (P.contains("datum")) {
                    if (!P.at("datum").is_array() || P.at("datum").as_array().size() < 3)
                        throw SourceUnavailable("'properties' has a 'datum' that is not an array of 3 numbers");
                    auto const &A = P.at("datum").as_array();
                    fc.datum = dp::Geo{toDouble(A[1]), toDouble(A[0]), toDouble(A[2])};
                }
                if (P.contains("heading")) {
                    if (!P.at("heading").is_number())
                        throw SourceUnavailable("'properties' has a non-numeric 'heading'");
                    fc.heading = dp::Euler{0.0, 0.0, toDouble(P.at("heading"))};
                }

                for (const auto &[key, value] : P) {
                    if (key != "crs" && key != "datum" && key != "heading") {
                        if (value.is_string()) {
                            fc.global_properties[std::string(key)] = std::string(value.as_string());
                        } else {
                            fc.global_properties[std::string(key)] = boost::json::serialize(value);
                        }
                    }
                }
            }

            if (!fc_obj.contains("features") || !fc_obj.at("features").is_array())
                throw SourceUnavailable("FeatureCollection has no 'features' array");

            auto const &features = fc_obj.at("features").as_array();
            fc.features.reserve(features.size());
            for (auto const &feat : features) {
                auto const &feat_obj = feat.as_object();
                if (!feat_obj.contains("geometry") || feat_obj.at("geometry").is_null())
                    continue;
                auto geoms = parseGeometry(feat_obj.at("geometry"));
                Properties props_map;
                if (feat_obj.contains("properties")) {
                    props_map = parseProperties(feat_obj.at("properties"));
                }
                for (auto &g : geoms)
                    fc.features.emplace_back(Feature{std::move(g), props_map});
            }

            return fc;
        }
    } // namespace

    FeatureCollection ParseFeatureCollection(const std::string &text) {
        try {
            return buildCollection(boost::json::parse(text));
        } catch (const SourceUnavailable &) {
            throw;
        } catch (const std::exception &e) {
            throw SourceUnavailable(std::string("peatgrid::ReadFeatureCollection(): malformed GeoJSON: ") + e.what());
        }
    }

    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs) {
            throw SourceUnavailable("peatgrid::ReadFeatureCollection(): cannot open \"" + file.string() + '\"');
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return ParseFeatureCollection(buffer.str());
    }

    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc) {
        os << "CRS: " << (fc.crs ? crsName(*fc.crs) : "undefined (" + fc.crs_identifier + ")") << "\n"
           << "DATUM: " << fc.datum.latitude << ", " << fc.datum.longitude << ", " << fc.datum.altitude << "\n"
           << "HEADING: " << fc.heading.yaw << "\n";
        os << "FEATURES: " << fc.features.size() << "\n";

        for (auto const &f : fc.features) {
            auto &v = f.geometry;
            if (auto *poly = std::get_if<Polygon>(&v)) {
                os << "  POLYGON (" << poly->inners().size() << " holes)\n";
            } else if (std::get_if<LineString>(&v)) {
                os << "  LINE\n";
            } else if (std::get_if<Point>(&v)) {
                os << "  POINT\n";
            }
            if (f.properties.size() > 0)
                os << "    PROPS:" << f.properties.size() << "\n";
        }

        return os;
    }

} // namespace peatgrid
