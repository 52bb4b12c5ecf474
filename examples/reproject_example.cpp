#include "peatgrid/peatgrid.hpp"
#include <iostream>

int main(int argc, char **argv) {
    if (argc != 3) {
        std::cerr << "usage: reproject_example <input.geojson> <output.geojson>\n";
        return 2;
    }

    try {
        // 1) Read a GeoJSON layer in WGS84, ENU or National Grid coordinates
        auto fc = peatgrid::read(argv[1]);

        std::cout << "Original file information:\n";
        std::cout << fc << "\n";

        // 2) Reproject the whole layer once into EPSG:27700
        peatgrid::Reprojector reprojector;
        auto bng = reprojector.reproject(fc);

        std::cout << "Reprojected layer:\n";
        std::cout << bng << "\n";

        // 3) Save it; coordinates are now metres on the National Grid
        peatgrid::write(bng, argv[2]);
        std::cout << "Saved " << argv[2] << "\n";
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
