#ifndef LUTNET_CORE_CONFIG_HPP
#define LUTNET_CORE_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "Defs.hpp"

namespace lutnet {

/**
 * @brief Parameters of a scalar weight table.
 *
 * num_values is the size of the input domain [0, num_values) and weight the
 * scalar every input is multiplied with. Validated on construction and
 * immutable afterwards.
 */
template <typename T>
class TableConfig {
public:
    TableConfig(int64_t num_values, T weight)
        : num_values_(checked_num_values(num_values)), weight_(weight) {
        if (!std::isfinite(weight)) {
            throw std::invalid_argument("weight must be a finite number.");
        }
    }

    // Domain given as a bit width: num_values = 2^input_bits
    static TableConfig from_bits(int input_bits, T weight) {
        if (input_bits <= 0 || input_bits > kMaxInputBits) {
            throw std::invalid_argument("input_bits must be in [1, " + std::to_string(kMaxInputBits)
                                        + "], got " + std::to_string(input_bits) + ".");
        }
        return TableConfig(int64_t(1) << input_bits, weight);
    }

    size_t num_values() const { return num_values_; }
    T weight() const { return weight_; }

    bool operator==(const TableConfig& other) const {
        return num_values_ == other.num_values_ && weight_ == other.weight_;
    }
    bool operator!=(const TableConfig& other) const { return !(*this == other); }

private:
    static size_t checked_num_values(int64_t n) {
        if (n <= 0) {
            throw std::invalid_argument("num_values must be a positive integer, got "
                                        + std::to_string(n) + ".");
        }
        if (static_cast<uint64_t>(n) > kMaxTableEntries) {
            throw std::invalid_argument("num_values " + std::to_string(n) + " exceeds the table limit of "
                                        + std::to_string(kMaxTableEntries) + " entries.");
        }
        return static_cast<size_t>(n);
    }

    size_t num_values_;
    T weight_;
};

} // namespace lutnet

#endif // LUTNET_CORE_CONFIG_HPP
