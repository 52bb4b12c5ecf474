#pragma once

#include "peatgrid/geometry.hpp"
#include "peatgrid/types.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace peatgrid {

    enum class GridSpacing : std::int64_t { Fifty = 50, Hundred = 100 };

    // Points on this coarser lattice are always tagged with it, whatever the configured spacing.
    inline constexpr std::int64_t COARSE_SPACING = 100;

    inline std::int64_t spacingValue(GridSpacing spacing) { return static_cast<std::int64_t>(spacing); }

    // include_50m_points: true -> 50, false -> 100
    GridSpacing spacingFromOption(bool include_50m_points);

    std::int64_t classifySpacing(std::int64_t easting, std::int64_t northing, GridSpacing spacing);

    // Walks the spacing-aligned lattice inside each polygon's bounding box and emits the points that lie
    // strictly inside it. Record ids continue across calls, so one sampler serves a whole run.
    //
    // The walk stops before the truncated x_max and y_max, so lattice points on those two edges of the
    // bounding box are never tested even when they fall inside the polygon.
    class GridSampler {
      public:
        using PointCallback = std::function<void(const SamplePoint &)>;

        explicit GridSampler(GridSpacing spacing, std::int64_t first_record_id = 1);

        // Returns the number of points passed to emit.
        std::size_t sample(const Polygon &polygon, const PointCallback &emit);

        std::vector<SamplePoint> sample(const Polygon &polygon);

        GridSpacing spacing() const { return spacing_; }

        std::int64_t nextRecordId() const { return next_record_id_; }

      private:
        GridSpacing spacing_;
        std::int64_t next_record_id_;
    };

} // namespace peatgrid
