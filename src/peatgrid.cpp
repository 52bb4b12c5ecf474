#include "peatgrid/peatgrid.hpp"

namespace peatgrid {

    FeatureCollection read(const std::filesystem::path &file) { return ReadFeatureCollection(file); }

    void write(const FeatureCollection &fc, const std::filesystem::path &outPath) {
        WriteFeatureCollection(fc, outPath);
    }

} // namespace peatgrid
