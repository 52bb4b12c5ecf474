#include "peatgrid/feedback.hpp"
#include "peatgrid/logging.hpp"

namespace peatgrid {

    void LoggingFeedback::setProgress(int percent) {
        if (percent == progress_) {
            return;
        }
        progress_ = percent;
        logger()->debug("progress {}%", percent);
    }

    void LoggingFeedback::pushInfo(const std::string &message) { logger()->info(message); }

    void LoggingFeedback::reportError(const std::string &message) { logger()->error(message); }

} // namespace peatgrid
