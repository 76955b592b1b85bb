#ifndef LUTNET_NEURON_LUTNEURON_HPP
#define LUTNET_NEURON_LUTNEURON_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "../lut/CombinationLUT.hpp"
#include "../lut/ScalarLUT.hpp"
#include "Neuron.hpp"

namespace lutnet {
namespace neuron {

/**
 * @brief Neuron whose output is read from a shared CombinationLUT.
 *
 * No arithmetic at inference time: forward() is a single table read.
 * Throws std::invalid_argument on wrong arity and std::out_of_range on
 * inputs outside the table.
 */
template <typename T>
class LUTNeuron : public Neuron<T> {
public:
    explicit LUTNeuron(std::shared_ptr<const CombinationLUT<T>> table) : table_(std::move(table)) {
        if (!table_) throw std::invalid_argument("LUTNeuron: table is null");
    }

    T forward(const std::vector<int64_t>& inputs) const override {
        return table_->at(inputs);
    }

    int arity() const override { return table_->num_inputs(); }

    std::string name() const override { return "LUTNeuron"; }

    const CombinationLUT<T>& table() const { return *table_; }

private:
    std::shared_ptr<const CombinationLUT<T>> table_;
};

/**
 * @brief Single-input neuron x * weight served from a ScalarLUT.
 */
template <typename T>
class WeightedNeuron : public Neuron<T> {
public:
    explicit WeightedNeuron(std::shared_ptr<const ScalarLUT<T>> table) : table_(std::move(table)) {
        if (!table_) throw std::invalid_argument("WeightedNeuron: table is null");
    }

    T forward(const std::vector<int64_t>& inputs) const override {
        if (inputs.size() != 1) {
            throw std::invalid_argument("Expected 1 input, got " + std::to_string(inputs.size()) + ".");
        }
        return table_->at(inputs[0]);
    }

    int arity() const override { return 1; }

    std::string name() const override { return "WeightedNeuron"; }

    const ScalarLUT<T>& table() const { return *table_; }

private:
    std::shared_ptr<const ScalarLUT<T>> table_;
};

} // namespace neuron
} // namespace lutnet

#endif // LUTNET_NEURON_LUTNEURON_HPP
