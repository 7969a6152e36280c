// Compute the bearoff database for a configuration and save it.
// Usage: bgend_compute <num_markers> <num_spots> [data_dir]
//   Writes <data_dir>/bgend_store_<num_markers>_<num_spots>.bin (default data/).

#include "bgend/game_config.h"
#include "bgend/store.h"
#include <chrono>
#include <iostream>
#include <iomanip>
#include <memory>
#include <string>

using namespace bgend;

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <num_markers> <num_spots> [data_dir]" << std::endl;
        return 1;
    }

    int num_markers = 0;
    int num_spots = 0;
    try {
        num_markers = std::stoi(argv[1]);
        num_spots = std::stoi(argv[2]);
    } catch (const std::exception&) {
        std::cerr << "num_markers and num_spots must be integers" << std::endl;
        return 1;
    }
    const std::string data_dir = argc > 3 ? argv[3] : "data";
    const std::string path = data_dir + "/bgend_store_" + std::to_string(num_markers) +
                             "_" + std::to_string(num_spots) + ".bin";

    try {
        auto config = std::make_shared<const GameConfiguration>(num_markers, num_spots);
        DistributionStore store(config);

        auto t0 = std::chrono::steady_clock::now();
        store.compute();
        auto t1 = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(t1 - t0).count();

        if (!store.save(path)) {
            std::cerr << "Failed to write " << path << std::endl;
            return 2;
        }

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "=== Bearoff database " << num_markers << " markers, "
                  << num_spots << " spots ===" << std::endl;
        std::cout << "  Boards:  " << store.size() << std::endl;
        std::cout << "  Time:    " << elapsed << " s" << std::endl;
        std::cout << "  Saved:   " << path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
