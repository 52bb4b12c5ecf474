#pragma once

#include "peatgrid/algorithm.hpp"
#include "peatgrid/feedback.hpp"
#include "peatgrid/grid_sampler.hpp"
#include "peatgrid/sink.hpp"
#include "peatgrid/types.hpp"

namespace peatgrid {

    struct LayerSamplingResult {
        std::size_t features_processed = 0;
        std::size_t points_emitted = 0;
        bool canceled = false;
    };

    // Samples every polygon feature of a layer that is already in British National Grid, forwarding each
    // point to sink as soon as it is found. Cancellation is checked before each feature; a feature that
    // has started is always scanned to the end.
    LayerSamplingResult sampleLayer(const FeatureCollection &bng_layer, GridSampler &sampler, PointSink &sink,
                                    Feedback &feedback);

    // "Create peat points": survey points at 100 m, or 50 m and 100 m, spacing aligned to the National Grid.
    class PeatDepthPoints : public Algorithm {
      public:
        static constexpr const char *INPUT = "INPUT";
        static constexpr const char *OUTPUT = "OUTPUT";
        static constexpr const char *GRID50 = "GRID50";

        AlgorithmDescription describe() const override;
        std::vector<ParameterDefinition> declareInputs() const override;
        Outputs run(const Parameters &parameters, Feedback &feedback) const override;
    };

} // namespace peatgrid
