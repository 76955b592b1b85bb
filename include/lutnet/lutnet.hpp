#ifndef LUTNET_HPP
#define LUTNET_HPP

// Core
#include "core/Defs.hpp"
#include "core/Config.hpp"
#include "core/Result.hpp"
#include "core/TableView.hpp"

// Tables
#include "lut/ScalarLUT.hpp"
#include "lut/CombinationLUT.hpp"

// Neurons
#include "neuron/Neuron.hpp"
#include "neuron/LUTNeuron.hpp"
#include "neuron/MultiplyNeuron.hpp"

#endif // LUTNET_HPP
