#ifndef LUTNET_LUT_SCALARLUT_HPP
#define LUTNET_LUT_SCALARLUT_HPP

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/Allocator.hpp"
#include "../core/Config.hpp"
#include "../core/Defs.hpp"
#include "../core/Result.hpp"
#include "../core/TableView.hpp"

namespace lutnet {

/**
 * @brief Non-throwing lookup of a precomputed product.
 *
 * Returns table[input] untouched when input is in [0, table.size()), an
 * OutOfRange result carrying the offending input otherwise.
 */
template <typename T>
LookupResult<T> lookup(core::TableView<T> table, int64_t input) {
    if (input < 0 || static_cast<uint64_t>(input) >= table.size()) {
        return LookupResult<T>::failure(LookupStatus::OutOfRange, input);
    }
    return LookupResult<T>::success(table[static_cast<size_t>(input)]);
}

/**
 * @brief Precomputed scalar multiplication table.
 *
 * Entry i holds i * weight for every i in [0, num_values). The table is
 * filled once in the constructor and is read-only afterwards, so one
 * instance can be shared by any number of readers without locking.
 *
 * Usage:
 *   ScalarLUT<float> lut(16, 0.75f);
 *   auto r = lut.lookup(3);      // r.value() == 2.25f
 *   float y = lut.at(3);         // throws std::out_of_range when invalid
 */
template <typename T>
class ScalarLUT {
public:
    using value_type = T;

    explicit ScalarLUT(const TableConfig<T>& config) : config_(config) {
        build();
    }

    ScalarLUT(int64_t num_values, T weight) : ScalarLUT(TableConfig<T>(num_values, weight)) {}

    const TableConfig<T>& config() const { return config_; }
    size_t size() const { return table_.size(); }
    T weight() const { return config_.weight(); }

    const T* data() const { return table_.data(); }
    core::TableView<T> view() const { return core::TableView<T>(table_.data(), table_.size()); }

    // Unchecked access for hot loops
    const T& operator[](size_t idx) const { return table_[idx]; }

    LookupResult<T> lookup(int64_t input) const {
        return lutnet::lookup(view(), input);
    }

    T at(int64_t input) const {
        LookupResult<T> r = lookup(input);
        if (!r) {
            throw std::out_of_range(out_of_range_message(input));
        }
        return r.value();
    }

    // Reports an out-of-range input on stderr and keeps going with fallback
    T lookup_or(int64_t input, T fallback = T(0)) const {
        LookupResult<T> r = lookup(input);
        if (!r) {
            std::cerr << "Error: " << out_of_range_message(input) << std::endl;
            return fallback;
        }
        return r.value();
    }

    bool operator==(const ScalarLUT& other) const {
        return config_ == other.config_ && table_ == other.table_;
    }
    bool operator!=(const ScalarLUT& other) const { return !(*this == other); }

private:
    void build() {
        const size_t n = config_.num_values();
        const T w = config_.weight();
        table_.resize(n);

        T* out = table_.data();
        LUTNET_SIMD_LOOP
        for (size_t i = 0; i < n; ++i) {
            out[i] = static_cast<T>(i) * w;
        }
    }

    std::string out_of_range_message(int64_t input) const {
        return "input value " + std::to_string(input) + " is out of range [0, "
               + std::to_string(table_.size()) + ")";
    }

    TableConfig<T> config_;
    std::vector<T, core::AlignedAllocator<T>> table_;
};

// Table Builder: precompute i * weight for i in [0, num_values)
template <typename T>
ScalarLUT<T> build_table(int64_t num_values, T weight) {
    return ScalarLUT<T>(num_values, weight);
}

template <typename T>
LookupResult<T> lookup(const ScalarLUT<T>& table, int64_t input) {
    return table.lookup(input);
}

} // namespace lutnet

#endif // LUTNET_LUT_SCALARLUT_HPP
