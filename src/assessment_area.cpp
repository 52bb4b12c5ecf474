#include "peatgrid/assessment_area.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/parser.hpp"
#include "peatgrid/writer.hpp"

#include <boost/geometry/algorithms/buffer.hpp>
#include <boost/geometry/algorithms/difference.hpp>
#include <boost/geometry/algorithms/union.hpp>
#include <boost/geometry/strategies/buffer.hpp>
#include <boost/geometry/strategies/cartesian/buffer_end_round.hpp>
#include <boost/geometry/strategies/cartesian/buffer_join_round.hpp>
#include <boost/geometry/strategies/cartesian/buffer_point_circle.hpp>
#include <boost/geometry/strategies/cartesian/buffer_side_straight.hpp>
#include <boost/geometry/strategies/agnostic/buffer_distance_symmetric.hpp>

#include <iomanip>
#include <sstream>
#include <variant>

namespace peatgrid {

    namespace {
        void addPolygon(MultiPolygon &acc, const Polygon &polygon) {
            MultiPolygon merged;
            bg::union_(acc, polygon, merged);
            acc = std::move(merged);
        }

        FeatureCollection reprojectLayer(const FeatureCollection &layer, const Reprojector &reprojector,
                                         const std::string &what) {
            try {
                return reprojector.reproject(layer);
            } catch (const ReprojectionFailure &e) {
                throw ReprojectionFailure(what + ": " + e.what());
            }
        }
    } // namespace

    MultiPolygon mergePolygons(const std::vector<FeatureCollection> &bng_layers) {
        MultiPolygon acc;
        for (const auto &layer : bng_layers) {
            for (const auto &feature : layer.features) {
                if (const auto *polygon = std::get_if<Polygon>(&feature.geometry)) {
                    addPolygon(acc, *polygon);
                }
            }
        }
        return acc;
    }

    MultiPolygon bufferLines(const FeatureCollection &bng_layer, double distance, int points_per_circle) {
        MultiLineString lines;
        for (const auto &feature : bng_layer.features) {
            if (const auto *line = std::get_if<LineString>(&feature.geometry)) {
                if (line->size() >= 2)
                    lines.push_back(*line);
            }
        }

        MultiPolygon corridor;
        if (lines.empty() || distance <= 0.0) {
            return corridor;
        }

        bg::strategy::buffer::distance_symmetric<double> distance_strategy(distance);
        bg::strategy::buffer::join_round join_strategy(points_per_circle);
        bg::strategy::buffer::end_round end_strategy(points_per_circle);
        bg::strategy::buffer::point_circle point_strategy(points_per_circle);
        bg::strategy::buffer::side_straight side_strategy;

        bg::buffer(lines, corridor, distance_strategy, side_strategy, join_strategy, end_strategy, point_strategy);
        return corridor;
    }

    MultiPolygon netAssessableArea(const FeatureCollection &site, const std::optional<FeatureCollection> &watercourses,
                                   const std::vector<FeatureCollection> &non_peatland, const Reprojector &reprojector,
                                   double buffer_distance) {
        auto bng_site = reprojectLayer(site, reprojector, "site boundary");
        MultiPolygon area = mergePolygons({bng_site});

        std::vector<FeatureCollection> bng_non_peatland;
        bng_non_peatland.reserve(non_peatland.size());
        for (std::size_t i = 0; i < non_peatland.size(); ++i) {
            bng_non_peatland.push_back(
                reprojectLayer(non_peatland[i], reprojector, "non-peatland layer " + std::to_string(i + 1)));
        }
        MultiPolygon excluded = mergePolygons(bng_non_peatland);

        if (watercourses) {
            auto bng_watercourses = reprojectLayer(*watercourses, reprojector, "watercourse layer");
            auto corridor = bufferLines(bng_watercourses, buffer_distance);
            for (const auto &part : corridor) {
                addPolygon(excluded, part);
            }
        }

        if (excluded.empty()) {
            return area;
        }

        MultiPolygon net;
        bg::difference(area, excluded, net);
        return net;
    }

    FeatureCollection toFeatureCollection(const MultiPolygon &area, const Properties &properties) {
        FeatureCollection fc;
        fc.crs = Reprojector::target();
        fc.crs_identifier = crsName(Reprojector::target());
        fc.features.reserve(area.size());
        for (const auto &part : area) {
            fc.features.push_back(Feature{part, properties});
        }
        return fc;
    }

    AlgorithmDescription PeatlandCodeAssessmentBase::describe() const {
        return AlgorithmDescription{"peatlandcodeassessmentbase", "Peatland code assessment unit base",
                                    "Generates assessment unit base for Peatland Code Field Protocol. Takes site "
                                    "outline and non-peatland features as inputs."};
    }

    std::vector<ParameterDefinition> PeatlandCodeAssessmentBase::declareInputs() const {
        return {
            {INPUT, "Site boundary", ParameterType::PolygonSource, false, ""},
            {WATER_COURSE, "Water course layer", ParameterType::LineSource, true, ""},
            {NON_PEATLAND, "Non-peatland layers", ParameterType::MultiplePolygonSources, true, ""},
            {BUFFER_DISTANCE, "Water course buffer distance (m)", ParameterType::Number, false, "30"},
            {OUTPUT, "Output layer", ParameterType::PolygonSink, false, ""},
        };
    }

    Outputs PeatlandCodeAssessmentBase::run(const Parameters &parameters, Feedback &feedback) const {
        const auto inputs = declareInputs();
        const auto site_path = parameterAsString(parameters, inputs[0]);
        const auto water_path = parameterAsString(parameters, inputs[1]);
        const auto non_peatland_paths = parameterAsPathList(parameters, inputs[2]);
        const double buffer_distance = parameterAsDouble(parameters, inputs[3]);
        const auto output = parameterAsString(parameters, inputs[4]);

        if (buffer_distance < 0.0) {
            throw InvalidParameter(std::string(BUFFER_DISTANCE) + " must not be negative");
        }

        auto site = ReadFeatureCollection(site_path);

        std::optional<FeatureCollection> watercourses;
        if (!water_path.empty()) {
            watercourses = ReadFeatureCollection(water_path);
        }

        std::vector<FeatureCollection> non_peatland;
        for (const auto &path : non_peatland_paths) {
            if (feedback.isCanceled()) {
                feedback.pushInfo("canceled before assessment area was built");
                return Outputs{};
            }
            non_peatland.push_back(ReadFeatureCollection(path));
        }

        feedback.pushInfo("building assessment base from " + std::to_string(non_peatland.size()) +
                          " non-peatland layers" + (watercourses ? " and a water course layer" : ""));

        Reprojector reprojector;
        auto net = netAssessableArea(site, watercourses, non_peatland, reprojector, buffer_distance);
        feedback.setProgress(90);

        std::ostringstream area_text;
        area_text << std::fixed << std::setprecision(2) << area(net);
        WriteFeatureCollection(toFeatureCollection(net, Properties{{"area_m2", area_text.str()}}), output);
        feedback.setProgress(100);
        feedback.pushInfo("net assessable area " + area_text.str() + " m2 in " + std::to_string(net.size()) +
                          " parts written to " + output);

        return Outputs{{OUTPUT, output}, {"AREA", area_text.str()}};
    }

} // namespace peatgrid
