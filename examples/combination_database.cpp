#include <lutnet/lutnet.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace lutnet;

int main(int argc, char** argv) {
    int num_inputs = 2;
    int input_bit_depth = 2;
    std::string operation_name = "multiply";

    if (argc > 1) num_inputs = std::atoi(argv[1]);
    if (argc > 2) input_bit_depth = std::atoi(argv[2]);
    if (argc > 3) operation_name = argv[3];

    std::cout << "Generating database with: num_inputs=" << num_inputs
              << ", input_bit_depth=" << input_bit_depth
              << ", operation='" << operation_name << "'" << std::endl;

    std::shared_ptr<const CombinationLUT<float>> table;
    try {
        Operation op = parse_operation(operation_name);
        table = std::make_shared<const CombinationLUT<float>>(num_inputs, input_bit_depth, op);
    } catch (const std::exception& e) {
        std::cerr << "Error generating database: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Database generated: " << table->size() << " entries" << std::endl;

    // Listing is capped; the table itself may be much larger
    const size_t listed = std::min<size_t>(table->size(), 64);
    for (size_t idx = 0; idx < listed; ++idx) {
        std::cout << "  " << CombinationLUT<float>::format(table->combination(idx))
                  << " -> " << (*table)[idx] << std::endl;
    }
    if (listed < table->size()) {
        std::cout << "  ... " << (table->size() - listed) << " more" << std::endl;
    }

    neuron::LUTNeuron<float> cell(table);
    std::vector<int64_t> sample(static_cast<size_t>(num_inputs), table->max_input_value());
    try {
        std::cout << cell.name() << " output for " << CombinationLUT<float>::format(sample)
                  << ": " << cell.forward(sample) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
