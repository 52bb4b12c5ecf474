#include "peatgrid/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace peatgrid {

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get("peatgrid")) {
                return existing;
            }
            auto created = spdlog::stderr_color_mt("peatgrid");
            created->set_pattern("[%H:%M:%S] [%^%l%$] %v");
            return created;
        }();
        return instance;
    }

    void setLogLevel(spdlog::level::level_enum level) { logger()->set_level(level); }

} // namespace peatgrid
