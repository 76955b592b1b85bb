#include <iostream>
#include <vector>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include "lutnet/core/Allocator.hpp"
#include "lutnet/lut/ScalarLUT.hpp"

using namespace lutnet;

void test_odd_allocation() {
    std::cout << "Testing Odd Allocation Alignment..." << std::endl;
    // 10 floats = 40 bytes, not a multiple of the 64 byte alignment.
    // The allocator pads the block but the vector still reports 10.
    try {
        std::vector<float, core::AlignedAllocator<float>> v(10, 3.14f);
        assert(v.size() == 10);
        assert(reinterpret_cast<uintptr_t>(v.data()) % kTableAlignment == 0);

        for (size_t i = 0; i < 10; ++i) {
            if (v[i] != 3.14f) throw std::runtime_error("Data mismatch");
        }

        std::cout << "PASS" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "FAIL: " << e.what() << std::endl;
        exit(1);
    }
}

void test_padding() {
    std::cout << "Testing Padded Sizes..." << std::endl;
    assert(core::AlignedAllocator<float>::padded_bytes(1) == 64);
    assert(core::AlignedAllocator<float>::padded_bytes(16) == 64);
    assert(core::AlignedAllocator<float>::padded_bytes(17) == 128);
    assert(core::AlignedAllocator<double>::padded_bytes(9) == 128);
    std::cout << "PASS" << std::endl;
}

void test_table_storage_alignment() {
    std::cout << "Testing Table Storage Alignment..." << std::endl;
    for (int64_t n : {1, 3, 17, 1000}) {
        ScalarLUT<float> lut(n, 2.0f);
        assert(reinterpret_cast<uintptr_t>(lut.data()) % kTableAlignment == 0);
    }
    std::cout << "PASS" << std::endl;
}

int main() {
    test_odd_allocation();
    test_padding();
    test_table_storage_alignment();
    return 0;
}
