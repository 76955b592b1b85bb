#include <lutnet/lutnet.hpp>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <vector>

using namespace lutnet;

int main(int argc, char** argv) {
    int input_bits = 4;
    float weight = 0.75f;

    if (argc > 1) input_bits = std::atoi(argv[1]);
    if (argc > 2) weight = static_cast<float>(std::atof(argv[2]));

    std::cout << "--- Precomputed Weight Table ---" << std::endl;

    try {
        TableConfig<float> config = TableConfig<float>::from_bits(input_bits, weight);
        ScalarLUT<float> lut(config);

        std::cout << "Input bits: " << input_bits << std::endl;
        std::cout << "Number of input values: " << config.num_values() << std::endl;
        std::cout << "Weight: " << config.weight() << std::endl;

        size_t shown = std::min<size_t>(lut.size(), 8);
        std::cout << "First " << shown << " table entries:" << std::endl;
        for (size_t i = 0; i < shown; ++i) {
            std::cout << "  table[" << i << "] = " << lut[i] << std::endl;
        }

        const int64_t n = static_cast<int64_t>(lut.size());
        std::vector<int64_t> demo_inputs = {0, 1, 3, n / 2, n - 1, -1, n};

        std::cout << "Lookups:" << std::endl;
        for (int64_t x : demo_inputs) {
            LookupResult<float> r = lut.lookup(x);
            if (r) {
                std::cout << "  input " << std::setw(3) << x << " -> " << r.value()
                          << " (direct: " << static_cast<float>(x) * weight << ")" << std::endl;
            } else {
                std::cout << "  input " << std::setw(3) << x << " -> " << to_string(r.status()) << std::endl;
            }
        }

        // Best-effort policy: reports on stderr and continues with 0
        std::cout << "Best-effort lookup of " << n << ": " << lut.lookup_or(n) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "--- Done ---" << std::endl;
    return 0;
}
