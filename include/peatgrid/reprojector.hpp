#pragma once

#include "peatgrid/crs_transformer.hpp"
#include "peatgrid/types.hpp"

namespace peatgrid {

    // Moves layers into British National Grid, the only frame points are sampled and written in.
    class Reprojector {
      public:
        static constexpr CRS target() { return CRS::BNG; }

        Reprojector();

        // Reprojects every feature of the layer in one pass. A layer already in the target frame is
        // returned as is. Identifiers outside the named systems are resolved by PROJ. Throws
        // ReprojectionFailure when the layer declares no reference system or one PROJ cannot map to the grid.
        FeatureCollection reproject(const FeatureCollection &layer) const;

        // Named systems only: WGS lon/lat, ENU around datum, or BNG.
        Geometry reproject(const Geometry &geometry, CRS source, const dp::Geo &datum) const;

        Point reprojectPoint(const Point &point, CRS source, const dp::Geo &datum) const;

      private:
        CrsTransformer wgs_to_grid_;
    };

} // namespace peatgrid
