// Compare the moves two stores pick and write every disagreement as CSV.
// Usage: bgend_disagreements <our_store> <their_store> <out_csv> [sample_every]
//   sample_every > 1 examines about one board in that many.

#include "bgend/compare.h"
#include "bgend/store.h"
#include <iostream>
#include <string>

using namespace bgend;

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <our_store> <their_store> <out_csv> [sample_every]" << std::endl;
        return 1;
    }

    CompareConfig cc;
    if (argc > 4) {
        try {
            cc.sample_every = std::stoi(argv[4]);
        } catch (const std::exception&) {
            std::cerr << "sample_every must be an integer" << std::endl;
            return 1;
        }
    }

    try {
        std::cout << "Reading stores" << std::endl;
        DistributionStore ours = DistributionStore::load(argv[1]);
        DistributionStore theirs = DistributionStore::load(argv[2]);

        std::cout << "Starting analysis" << std::endl;
        CompareResult result = find_disagreements(ours, theirs, cc);

        if (!write_disagreements_csv(result.disagreements, argv[3])) {
            std::cerr << "Failed to write " << argv[3] << std::endl;
            return 2;
        }
        std::cout << "Wrote " << argv[3] << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
    return 0;
}
