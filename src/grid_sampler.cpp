#include "peatgrid/grid_sampler.hpp"

namespace peatgrid {

    GridSpacing spacingFromOption(bool include_50m_points) {
        return include_50m_points ? GridSpacing::Fifty : GridSpacing::Hundred;
    }

    std::int64_t classifySpacing(std::int64_t easting, std::int64_t northing, GridSpacing spacing) {
        if (easting % COARSE_SPACING == 0 && northing % COARSE_SPACING == 0) {
            return COARSE_SPACING;
        }
        return spacingValue(spacing);
    }

    GridSampler::GridSampler(GridSpacing spacing, std::int64_t first_record_id)
        : spacing_(spacing), next_record_id_(first_record_id) {}

    std::size_t GridSampler::sample(const Polygon &polygon, const PointCallback &emit) {
        auto bbox = boundingBox(polygon);
        if (!bbox) {
            return 0;
        }

        const std::int64_t step = spacingValue(spacing_);
        const std::int64_t start_x = roundUpToMultiple(bbox->x_min, step);
        const std::int64_t start_y = roundUpToMultiple(bbox->y_min, step);

        std::size_t emitted = 0;
        for (std::int64_t y = start_y; y < bbox->y_max; y += step) {
            for (std::int64_t x = start_x; x < bbox->x_max; x += step) {
                if (!strictlyWithin(x, y, polygon)) {
                    continue;
                }

                SamplePoint point;
                point.record_id = next_record_id_++;
                point.easting = x;
                point.northing = y;
                point.spacing = classifySpacing(x, y, spacing_);
                emit(point);
                ++emitted;
            }
        }
        return emitted;
    }

    std::vector<SamplePoint> GridSampler::sample(const Polygon &polygon) {
        std::vector<SamplePoint> points;
        sample(polygon, [&points](const SamplePoint &p) { points.push_back(p); });
        return points;
    }

} // namespace peatgrid
