// Convert a gnubg one-sided bearoff text dump into a store file, so it can be
// compared against our database with bgend_disagreements.
// Usage: bgend_gnubg_to_store <dump_file> <out_file> [num_markers num_spots]
//   Defaults to the standard 15 markers, 6 spots.

#include "bgend/gnubg.h"
#include "bgend/store.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace bgend;

int main(int argc, char* argv[]) {
    if (argc != 3 && argc != 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <dump_file> <out_file> [num_markers num_spots]" << std::endl;
        return 1;
    }

    int num_markers = 15;
    int num_spots = 6;
    if (argc == 5) {
        try {
            num_markers = std::stoi(argv[3]);
            num_spots = std::stoi(argv[4]);
        } catch (const std::exception&) {
            std::cerr << "num_markers and num_spots must be integers" << std::endl;
            return 1;
        }
    }

    std::ifstream in(argv[1]);
    if (!in) {
        std::cerr << "Cannot open " << argv[1] << std::endl;
        return 1;
    }

    try {
        auto config = std::make_shared<const GameConfiguration>(num_markers, num_spots);
        auto entries = parse_gnubg_dump(in);
        std::cout << "Read " << entries.size() << " positions from " << argv[1] << std::endl;

        DistributionStore store = create_distribution_store_from_gnubg(config, entries);
        if (!store.is_complete()) {
            std::cout << "Warning: dump covers " << store.size() << " of "
                      << config->num_valid_boards() << " boards" << std::endl;
        }
        if (!store.save(argv[2])) {
            std::cerr << "Failed to write " << argv[2] << std::endl;
            return 2;
        }
        std::cout << "Saved " << argv[2] << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
    return 0;
}
