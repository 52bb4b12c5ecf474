#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace peatgrid {

    // Shared "peatgrid" logger writing to stderr, created on first use.
    std::shared_ptr<spdlog::logger> logger();

    void setLogLevel(spdlog::level::level_enum level);

} // namespace peatgrid
