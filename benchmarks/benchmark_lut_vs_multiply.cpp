#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>

#include "../include/lutnet/lutnet.hpp"

using namespace lutnet;

int main(int argc, char** argv) {
    int iterations = 200;
    if (argc > 1) iterations = std::atoi(argv[1]);
    if (iterations <= 0) {
        std::cerr << "Error: iterations must be positive" << std::endl;
        return 1;
    }

    const int input_bits = 8;
    const float weight = 0.75f;
    ScalarLUT<float> lut(TableConfig<float>::from_bits(input_bits, weight));

    // Fixed seed so both paths see the same inputs on every run
    const size_t N = 1 << 20;
    std::vector<int32_t> inputs(N);
    std::mt19937 gen(42);
    std::uniform_int_distribution<int32_t> dist(0, static_cast<int32_t>(lut.size()) - 1);
    for (auto& x : inputs) x = dist(gen);

    std::vector<float> out_lut(N), out_mul(N);
    const float* table = lut.data();

    std::cout << "--- LUT vs Multiply (" << N << " inputs, " << iterations << " iterations) ---" << std::endl;

    auto start = std::chrono::high_resolution_clock::now();
    for (int it = 0; it < iterations; ++it) {
        LUTNET_PARALLEL_LOOP
        for (long i = 0; i < (long)N; ++i) {
            out_lut[i] = table[inputs[i]];
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    double time_lut = std::chrono::duration<double>(end - start).count();

    start = std::chrono::high_resolution_clock::now();
    for (int it = 0; it < iterations; ++it) {
        LUTNET_PARALLEL_LOOP
        for (long i = 0; i < (long)N; ++i) {
            out_mul[i] = static_cast<float>(inputs[i]) * weight;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    double time_mul = std::chrono::duration<double>(end - start).count();

    size_t mismatches = 0;
    for (size_t i = 0; i < N; ++i) {
        if (out_lut[i] != out_mul[i]) mismatches++;
    }

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "LUT Time:      " << time_lut << " s" << std::endl;
    std::cout << "Multiply Time: " << time_mul << " s" << std::endl;
    std::cout << "Ratio (Multiply / LUT): " << time_mul / time_lut << "x" << std::endl;
    std::cout << "Mismatches: " << mismatches << std::endl;

    return mismatches == 0 ? 0 : 1;
}
