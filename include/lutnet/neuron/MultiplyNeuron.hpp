#ifndef LUTNET_NEURON_MULTIPLYNEURON_HPP
#define LUTNET_NEURON_MULTIPLYNEURON_HPP

#include <stdexcept>
#include <string>

#include "Neuron.hpp"

namespace lutnet {
namespace neuron {

// Reference neuron: weight * x_0 * ... * x_{n-1} computed on every call
template <typename T>
class MultiplyNeuron : public Neuron<T> {
public:
    MultiplyNeuron(int arity, T weight = T(1)) : arity_(arity), weight_(weight) {
        if (arity <= 0) throw std::invalid_argument("MultiplyNeuron: arity must be positive");
    }

    T forward(const std::vector<int64_t>& inputs) const override {
        if (inputs.size() != static_cast<size_t>(arity_)) {
            throw std::invalid_argument("Expected " + std::to_string(arity_) + " inputs, got "
                                        + std::to_string(inputs.size()) + ".");
        }
        T result = weight_;
        for (int64_t x : inputs) result *= static_cast<T>(x);
        return result;
    }

    int arity() const override { return arity_; }

    std::string name() const override { return "MultiplyNeuron"; }

    T weight() const { return weight_; }

private:
    int arity_;
    T weight_;
};

} // namespace neuron
} // namespace lutnet

#endif // LUTNET_NEURON_MULTIPLYNEURON_HPP
