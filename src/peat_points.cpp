#include "peatgrid/peat_points.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/parser.hpp"
#include "peatgrid/reprojector.hpp"

#include <variant>

namespace peatgrid {

    LayerSamplingResult sampleLayer(const FeatureCollection &bng_layer, GridSampler &sampler, PointSink &sink,
                                    Feedback &feedback) {
        if (bng_layer.crs != Reprojector::target()) {
            throw ReprojectionFailure("sampleLayer: layer must be in " + crsName(Reprojector::target()));
        }

        LayerSamplingResult result;
        const auto total = bng_layer.features.size();

        for (std::size_t current = 0; current < total; ++current) {
            if (feedback.isCanceled()) {
                result.canceled = true;
                break;
            }

            const auto *polygon = std::get_if<Polygon>(&bng_layer.features[current].geometry);
            if (polygon) {
                result.points_emitted +=
                    sampler.sample(*polygon, [&sink](const SamplePoint &point) { sink.addPoint(point); });
            } else {
                feedback.pushInfo("skipping feature " + std::to_string(current) + ": not a polygon");
            }
            ++result.features_processed;

            feedback.setProgress(static_cast<int>((current + 1) * 100 / total));
        }

        return result;
    }

    AlgorithmDescription PeatDepthPoints::describe() const {
        return AlgorithmDescription{"peatpoints", "Create peat points",
                                    "Generates a peat depth and condition survey layer with 100m or 50m point "
                                    "spacings aligned to British National Grid"};
    }

    std::vector<ParameterDefinition> PeatDepthPoints::declareInputs() const {
        return {
            {INPUT, "Input layer", ParameterType::PolygonSource, false, ""},
            {OUTPUT, "Output layer", ParameterType::PointSink, false, ""},
            {GRID50, "Include 50m points?", ParameterType::Boolean, false, "true"},
        };
    }

    Outputs PeatDepthPoints::run(const Parameters &parameters, Feedback &feedback) const {
        const auto inputs = declareInputs();
        const auto input = parameterAsString(parameters, inputs[0]);
        const auto output = parameterAsString(parameters, inputs[1]);
        const auto spacing = spacingFromOption(parameterAsBool(parameters, inputs[2]));

        feedback.pushInfo("Starting processing algo");

        auto source = ReadFeatureCollection(input);

        // once per layer, never per sample point
        Reprojector reprojector;
        if (source.crs != Reprojector::target()) {
            feedback.pushInfo("reprojecting " + input + " from " + source.crs_identifier + " to " +
                              crsName(Reprojector::target()));
        }
        auto layer = reprojector.reproject(source);

        GeoJsonPointSink sink(output);
        GridSampler sampler(spacing);

        auto result = sampleLayer(layer, sampler, sink, feedback);
        sink.commit();

        if (result.canceled) {
            feedback.pushInfo("canceled after " + std::to_string(result.features_processed) + " of " +
                              std::to_string(layer.features.size()) + " features");
        }
        feedback.pushInfo("wrote " + std::to_string(result.points_emitted) + " points at " +
                          std::to_string(spacingValue(spacing)) + "m spacing to " + output);

        return Outputs{{OUTPUT, output}, {"POINT_COUNT", std::to_string(result.points_emitted)}};
    }

} // namespace peatgrid
