#ifndef LUTNET_CORE_RESULT_HPP
#define LUTNET_CORE_RESULT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lutnet {

enum class LookupStatus {
    Ok,
    OutOfRange,     // input outside the table's domain
    ArityMismatch   // wrong number of inputs for a combination table
};

inline const char* to_string(LookupStatus status) {
    switch (status) {
        case LookupStatus::Ok: return "Ok";
        case LookupStatus::OutOfRange: return "OutOfRange";
        case LookupStatus::ArityMismatch: return "ArityMismatch";
    }
    return "Unknown";
}

/**
 * @brief Outcome of a non-throwing table lookup.
 *
 * Either holds the precomputed value (status Ok) or an error status. A value
 * of zero is always a real table entry, never an error marker.
 */
template <typename T>
class LookupResult {
public:
    static LookupResult success(T value) {
        return LookupResult(LookupStatus::Ok, value, 0);
    }

    static LookupResult failure(LookupStatus status, int64_t input) {
        return LookupResult(status, T(0), input);
    }

    bool ok() const { return status_ == LookupStatus::Ok; }
    explicit operator bool() const { return ok(); }

    LookupStatus status() const { return status_; }

    // Offending input for OutOfRange, offending arity for ArityMismatch
    int64_t input() const { return input_; }

    T value() const {
        if (!ok()) {
            throw std::logic_error(std::string("LookupResult has no value: ") + to_string(status_)
                                   + " (input " + std::to_string(input_) + ")");
        }
        return value_;
    }

    T value_or(T fallback) const { return ok() ? value_ : fallback; }

private:
    LookupResult(LookupStatus status, T value, int64_t input)
        : status_(status), value_(value), input_(input) {}

    LookupStatus status_;
    T value_;
    int64_t input_;
};

} // namespace lutnet

#endif // LUTNET_CORE_RESULT_HPP
