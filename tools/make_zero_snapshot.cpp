// Write a parameter snapshot with every tensor the configured model expects,
// all values zero. The engine then reduces to the plain regularized solve.
//
// Usage: ./tagsense_zero_snapshot [-c config.ini] <output.tsnp>

#include "tagsense/errors.hpp"
#include "tagsense/snapshot.hpp"
#include "tagsense/types.hpp"

#include <cstring>
#include <iostream>

using namespace tagsense;

int main(int argc, char** argv) {
    EstimatorConfig config;
    const char* output_file = nullptr;
    bool list_only = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            try {
                if (!config.load(argv[++i])) {
                    std::cerr << "Error: Cannot open config file: " << argv[i] << "\n";
                    return 1;
                }
            } catch (const Error& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-l") == 0) {
            list_only = true;
        } else if (argv[i][0] != '-') {
            output_file = argv[i];
        }
    }

    if (list_only) {
        for (const TensorSpec& spec : expectedTensorLayout(config)) {
            std::cout << spec.name << " [";
            for (size_t d = 0; d < spec.shape.size(); ++d) {
                std::cout << (d ? ", " : "") << spec.shape[d];
            }
            std::cout << "]\n";
        }
        return 0;
    }

    if (!output_file) {
        std::cerr << "Usage: " << argv[0] << " [-c config.ini] [-l] <output.tsnp>\n";
        std::cerr << "  -l    List expected tensor names and shapes\n";
        return 1;
    }

    ParameterSnapshot snapshot = zeroSnapshot(config);
    if (!snapshot.save(output_file)) {
        std::cerr << "Error: Cannot write " << output_file << "\n";
        return 1;
    }
    std::cout << "Wrote " << snapshot.size() << " tensors to " << output_file << "\n";
    return 0;
}
