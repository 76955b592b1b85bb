#include <lutnet/core/Config.hpp>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace lutnet;

template <typename Func>
bool throws_invalid_argument(Func f) {
    try {
        f();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_explicit_domain() {
    std::cout << "Testing Explicit Domain Size..." << std::endl;
    TableConfig<float> c(16, 0.75f);
    assert(c.num_values() == 16);
    assert(c.weight() == 0.75f);
    std::cout << "PASS" << std::endl;
}

void test_from_bits() {
    std::cout << "Testing Domain From Bit Width..." << std::endl;
    assert(TableConfig<float>::from_bits(1, 1.0f).num_values() == 2);
    assert(TableConfig<float>::from_bits(4, 1.0f).num_values() == 16);
    assert(TableConfig<float>::from_bits(8, 1.0f).num_values() == 256);
    assert(TableConfig<float>::from_bits(4, 0.75f) == TableConfig<float>(16, 0.75f));
    std::cout << "PASS" << std::endl;
}

void test_rejects_invalid() {
    std::cout << "Testing Invalid Configurations..." << std::endl;
    assert(throws_invalid_argument([] { TableConfig<float>(0, 1.0f); }));
    assert(throws_invalid_argument([] { TableConfig<float>(-3, 1.0f); }));
    assert(throws_invalid_argument([] { TableConfig<float>::from_bits(0, 1.0f); }));
    assert(throws_invalid_argument([] { TableConfig<float>::from_bits(-2, 1.0f); }));
    assert(throws_invalid_argument([] { TableConfig<float>::from_bits(kMaxInputBits + 1, 1.0f); }));
    assert(throws_invalid_argument([] { TableConfig<float>(int64_t(kMaxTableEntries) + 1, 1.0f); }));
    assert(throws_invalid_argument([] { TableConfig<float>(4, std::numeric_limits<float>::quiet_NaN()); }));
    assert(throws_invalid_argument([] { TableConfig<float>(4, std::numeric_limits<float>::infinity()); }));
    std::cout << "PASS" << std::endl;
}

int main() {
    test_explicit_domain();
    test_from_bits();
    test_rejects_invalid();
    std::cout << "All Config tests passed!" << std::endl;
    return 0;
}
