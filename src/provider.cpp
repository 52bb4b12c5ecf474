#include "peatgrid/provider.hpp"
#include "peatgrid/assessment_area.hpp"
#include "peatgrid/peat_points.hpp"

namespace peatgrid {

    Provider::Provider() {
        algorithms_.push_back(std::make_unique<PeatDepthPoints>());
        algorithms_.push_back(std::make_unique<PeatlandCodeAssessmentBase>());
    }

    const Algorithm *Provider::find(const std::string &algorithm_id) const {
        for (const auto &algorithm : algorithms_) {
            if (algorithm->describe().id == algorithm_id) {
                return algorithm.get();
            }
        }
        return nullptr;
    }

} // namespace peatgrid
