#include <lutnet/core/Result.hpp>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace lutnet;

void test_success() {
    std::cout << "Testing Successful Result..." << std::endl;
    auto r = LookupResult<float>::success(2.25f);
    assert(r.ok());
    assert(static_cast<bool>(r));
    assert(r.status() == LookupStatus::Ok);
    assert(r.value() == 2.25f);
    assert(r.value_or(-1.0f) == 2.25f);
    std::cout << "PASS" << std::endl;
}

void test_zero_is_not_an_error() {
    std::cout << "Testing Zero Value vs Error..." << std::endl;
    auto zero = LookupResult<float>::success(0.0f);
    auto err = LookupResult<float>::failure(LookupStatus::OutOfRange, -1);

    assert(zero.ok());
    assert(!err.ok());
    assert(zero.value() == 0.0f);
    assert(err.value_or(0.0f) == 0.0f);
    std::cout << "PASS" << std::endl;
}

void test_failure_has_no_value() {
    std::cout << "Testing Failure Access..." << std::endl;
    auto r = LookupResult<double>::failure(LookupStatus::OutOfRange, 99);
    assert(r.input() == 99);
    assert(std::string(to_string(r.status())) == "OutOfRange");

    bool threw = false;
    try {
        (void)r.value();
    } catch (const std::logic_error& e) {
        threw = true;
        assert(std::string(e.what()).find("99") != std::string::npos);
    }
    assert(threw);
    std::cout << "PASS" << std::endl;
}

int main() {
    test_success();
    test_zero_is_not_an_error();
    test_failure_has_no_value();
    std::cout << "All LookupResult tests passed!" << std::endl;
    return 0;
}
