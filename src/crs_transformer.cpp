#include "peatgrid/crs_transformer.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/logging.hpp"

#include <proj.h>

#include <cmath>

namespace peatgrid {

    struct CrsTransformer::Impl {
        PJ_CONTEXT *context = nullptr;
        PJ *transform = nullptr;

        ~Impl() {
            if (transform)
                proj_destroy(transform);
            if (context)
                proj_context_destroy(context);
        }

        std::string lastError() const {
            const int code = proj_context_errno(context);
            const char *text = proj_context_errno_string(context, code);
            return text ? text : "error " + std::to_string(code);
        }

        Point apply(const Point &point, PJ_DIRECTION direction, const std::string &label) const {
            proj_errno_reset(transform);
            PJ_COORD out = proj_trans(transform, direction, proj_coord(point.x, point.y, point.z, 0.0));
            if (!std::isfinite(out.xyz.x) || !std::isfinite(out.xyz.y) || proj_errno(transform) != 0) {
                throw ReprojectionFailure("CrsTransformer: cannot transform (" + std::to_string(point.x) + ", " +
                                          std::to_string(point.y) + ") " + label + ": " + lastError());
            }
            return Point{out.xyz.x, out.xyz.y, std::isfinite(out.xyz.z) ? out.xyz.z : point.z};
        }
    };

    CrsTransformer::CrsTransformer(const std::string &source, const std::string &target)
        : impl_(std::make_unique<Impl>()), source_(source), target_(target) {
        impl_->context = proj_context_create();
        if (!impl_->context) {
            throw ReprojectionFailure("CrsTransformer: cannot create a PROJ context");
        }
        // failures are reported through exceptions instead
        proj_log_level(impl_->context, PJ_LOG_NONE);

        PJ *raw = proj_create_crs_to_crs(impl_->context, source.c_str(), target.c_str(), nullptr);
        if (!raw) {
            throw ReprojectionFailure("CrsTransformer: no transform from '" + source + "' to '" + target +
                                      "': " + impl_->lastError());
        }
        impl_->transform = proj_normalize_for_visualization(impl_->context, raw);
        proj_destroy(raw);
        if (!impl_->transform) {
            throw ReprojectionFailure("CrsTransformer: cannot normalise axis order from '" + source + "' to '" +
                                      target + "': " + impl_->lastError());
        }
        logger()->debug("transform {} -> {} ready", source, target);
    }

    CrsTransformer::~CrsTransformer() = default;

    CrsTransformer::CrsTransformer(CrsTransformer &&) noexcept = default;

    CrsTransformer &CrsTransformer::operator=(CrsTransformer &&) noexcept = default;

    Point CrsTransformer::forward(const Point &point) const {
        return impl_->apply(point, PJ_FWD, "from " + source_ + " to " + target_);
    }

    Point CrsTransformer::inverse(const Point &point) const {
        return impl_->apply(point, PJ_INV, "from " + target_ + " to " + source_);
    }

} // namespace peatgrid
