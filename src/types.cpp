#include "peatgrid/types.hpp"

#include <algorithm>
#include <cctype>

namespace peatgrid {

    std::optional<CRS> parseCrs(const std::string &identifier) {
        std::string s = identifier;
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

        if (s == "EPSG:4326" || s == "WGS84" || s == "WGS" || s == "URN:OGC:DEF:CRS:OGC:1.3:CRS84" ||
            s == "URN:OGC:DEF:CRS:EPSG::4326")
            return CRS::WGS;
        if (s == "ENU")
            return CRS::ENU;
        if (s == "EPSG:27700" || s == "BNG" || s == "OSGB36" || s == "URN:OGC:DEF:CRS:EPSG::27700")
            return CRS::BNG;
        return std::nullopt;
    }

    std::string crsName(CRS crs) {
        switch (crs) {
        case CRS::WGS:
            return "EPSG:4326";
        case CRS::ENU:
            return "ENU";
        case CRS::BNG:
            return "EPSG:27700";
        }
        return "";
    }

    bool operator==(const SamplePoint &lhs, const SamplePoint &rhs) {
        return lhs.record_id == rhs.record_id && lhs.easting == rhs.easting && lhs.northing == rhs.northing &&
               lhs.date == rhs.date && lhs.spacing == rhs.spacing && lhs.peat_depth == rhs.peat_depth &&
               lhs.main_con == rhs.main_con && lhs.sub_con == rhs.sub_con && lhs.notes == rhs.notes &&
               lhs.photo == rhs.photo;
    }

    bool operator!=(const SamplePoint &lhs, const SamplePoint &rhs) { return !(lhs == rhs); }

} // namespace peatgrid
