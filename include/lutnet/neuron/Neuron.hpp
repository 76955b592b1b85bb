#ifndef LUTNET_NEURON_NEURON_HPP
#define LUTNET_NEURON_NEURON_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace lutnet {
namespace neuron {

template <typename T>
class Neuron {
public:
    virtual ~Neuron() = default;

    // Output for one set of discrete inputs
    virtual T forward(const std::vector<int64_t>& inputs) const = 0;

    // Number of inputs forward() expects
    virtual int arity() const = 0;

    virtual std::string name() const = 0;
};

} // namespace neuron
} // namespace lutnet

#endif // LUTNET_NEURON_NEURON_HPP
