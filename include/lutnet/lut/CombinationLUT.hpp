#ifndef LUTNET_LUT_COMBINATIONLUT_HPP
#define LUTNET_LUT_COMBINATIONLUT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/Allocator.hpp"
#include "../core/Defs.hpp"
#include "../core/Result.hpp"
#include "../core/TableView.hpp"

namespace lutnet {

enum class Operation {
    Multiply
};

inline const char* to_string(Operation op) {
    switch (op) {
        case Operation::Multiply: return "multiply";
    }
    return "unknown";
}

inline Operation parse_operation(const std::string& name) {
    if (name == "multiply") return Operation::Multiply;
    throw std::invalid_argument("Unsupported operation: " + name);
}

/**
 * @brief Precomputed results of an operation over every input combination.
 *
 * Each of the num_inputs inputs takes a value in [0, 2^input_bit_depth).
 * Combinations are stored in lexicographic order (last input varies
 * fastest), so the entry for (x_0, ..., x_{n-1}) lives at the mixed-radix
 * index sum(x_k * radix^(n-1-k)).
 *
 * Example: num_inputs = 2, input_bit_depth = 1, Multiply
 *   (0,0) -> 0, (0,1) -> 0, (1,0) -> 0, (1,1) -> 1
 */
template <typename T>
class CombinationLUT {
public:
    CombinationLUT(int num_inputs, int input_bit_depth, Operation op = Operation::Multiply)
        : num_inputs_(num_inputs), input_bit_depth_(input_bit_depth), op_(op) {
        if (num_inputs <= 0) {
            throw std::invalid_argument("num_inputs must be a positive integer.");
        }
        if (input_bit_depth <= 0) {
            throw std::invalid_argument("input_bit_depth must be a positive integer.");
        }

        uint64_t total = 1;
        for (int k = 0; k < num_inputs; ++k) {
            // Checked before every step so the product never overflows
            if (input_bit_depth > kMaxInputBits || total > (kMaxTableEntries >> input_bit_depth)) {
                throw std::invalid_argument("Combination table for " + std::to_string(num_inputs)
                                            + " inputs of " + std::to_string(input_bit_depth)
                                            + " bits exceeds the table limit of "
                                            + std::to_string(kMaxTableEntries) + " entries.");
            }
            total <<= input_bit_depth;
        }
        radix_ = size_t(1) << input_bit_depth;

        table_.resize(static_cast<size_t>(total));
        build();
    }

    int num_inputs() const { return num_inputs_; }
    int input_bit_depth() const { return input_bit_depth_; }
    Operation operation() const { return op_; }

    // Number of distinct values a single input can take
    size_t radix() const { return radix_; }
    int64_t max_input_value() const { return static_cast<int64_t>(radix_) - 1; }

    size_t size() const { return table_.size(); }
    core::TableView<T> view() const { return core::TableView<T>(table_.data(), table_.size()); }

    const T& operator[](size_t idx) const { return table_[idx]; }

    LookupResult<T> query(const std::vector<int64_t>& inputs) const {
        if (inputs.size() != static_cast<size_t>(num_inputs_)) {
            return LookupResult<T>::failure(LookupStatus::ArityMismatch,
                                            static_cast<int64_t>(inputs.size()));
        }
        size_t idx = 0;
        for (int64_t x : inputs) {
            if (x < 0 || static_cast<uint64_t>(x) >= radix_) {
                return LookupResult<T>::failure(LookupStatus::OutOfRange, x);
            }
            idx = idx * radix_ + static_cast<size_t>(x);
        }
        return LookupResult<T>::success(table_[idx]);
    }

    T at(const std::vector<int64_t>& inputs) const {
        LookupResult<T> r = query(inputs);
        switch (r.status()) {
            case LookupStatus::Ok:
                return r.value();
            case LookupStatus::ArityMismatch:
                throw std::invalid_argument("Expected " + std::to_string(num_inputs_) + " inputs, got "
                                            + std::to_string(inputs.size()) + ".");
            case LookupStatus::OutOfRange:
                break;
        }
        throw std::out_of_range("Input combination " + format(inputs) + " not found in the table.");
    }

    // Inputs of the combination stored at idx
    std::vector<int64_t> combination(size_t idx) const {
        if (idx >= table_.size()) {
            throw std::out_of_range("Combination index " + std::to_string(idx) + " out of range [0, "
                                    + std::to_string(table_.size()) + ")");
        }
        std::vector<int64_t> inputs(static_cast<size_t>(num_inputs_));
        for (int k = num_inputs_ - 1; k >= 0; --k) {
            inputs[k] = static_cast<int64_t>(idx % radix_);
            idx /= radix_;
        }
        return inputs;
    }

    static std::string format(const std::vector<int64_t>& inputs) {
        std::string s = "(";
        for (size_t k = 0; k < inputs.size(); ++k) {
            if (k) s += ", ";
            s += std::to_string(inputs[k]);
        }
        return s + ")";
    }

private:
    void build() {
        const size_t n = table_.size();
        switch (op_) {
            case Operation::Multiply:
                for (size_t idx = 0; idx < n; ++idx) {
                    size_t rest = idx;
                    T result = T(1);
                    for (int k = 0; k < num_inputs_; ++k) {
                        result *= static_cast<T>(rest % radix_);
                        rest /= radix_;
                    }
                    table_[idx] = result;
                }
                break;
        }
    }

    int num_inputs_;
    int input_bit_depth_;
    Operation op_;
    size_t radix_ = 0;
    std::vector<T, core::AlignedAllocator<T>> table_;
};

} // namespace lutnet

#endif // LUTNET_LUT_COMBINATIONLUT_HPP
