#pragma once

#include "peatgrid/geometry.hpp"

#include <memory>
#include <string>

namespace peatgrid {

    // Coordinate transform between two reference systems, resolved by PROJ from any definition it
    // understands ("EPSG:3857", "urn:ogc:def:crs:EPSG::4258", a PROJ string, ...). Axis order is normalised
    // for GIS use: geographic systems take longitude as x and latitude as y.
    class CrsTransformer {
      public:
        // Throws ReprojectionFailure when no transform between the two definitions can be built.
        CrsTransformer(const std::string &source, const std::string &target);
        ~CrsTransformer();

        CrsTransformer(CrsTransformer &&) noexcept;
        CrsTransformer &operator=(CrsTransformer &&) noexcept;

        // z is carried through. Throws ReprojectionFailure for a coordinate PROJ cannot transform.
        Point forward(const Point &point) const;
        Point inverse(const Point &point) const;

        const std::string &source() const { return source_; }
        const std::string &target() const { return target_; }

      private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        std::string source_;
        std::string target_;
    };

} // namespace peatgrid
