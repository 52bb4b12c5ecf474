#pragma once

#include "peatgrid/assessment_area.hpp"
#include "peatgrid/cli.hpp"
#include "peatgrid/crs_transformer.hpp"
#include "peatgrid/error.hpp"
#include "peatgrid/grid_sampler.hpp"
#include "peatgrid/parser.hpp"
#include "peatgrid/peat_points.hpp"
#include "peatgrid/provider.hpp"
#include "peatgrid/reprojector.hpp"
#include "peatgrid/sink.hpp"
#include "peatgrid/types.hpp"
#include "peatgrid/writer.hpp"

#include <filesystem>

namespace peatgrid {

    FeatureCollection read(const std::filesystem::path &file);

    void write(const FeatureCollection &fc, const std::filesystem::path &outPath);

} // namespace peatgrid

namespace pg = peatgrid;
