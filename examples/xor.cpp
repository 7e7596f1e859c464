#include <vector>

#include "microrunn/microrunn.h"

int main() {
    std::vector<std::vector<mr::Value>> inputs = {
        mr::nn::to_values({0, 0}),
        mr::nn::to_values({0, 1}),
        mr::nn::to_values({1, 0}),
        mr::nn::to_values({1, 1}),
    };
    std::vector<mr::Value> targets = mr::nn::to_values({0, 1, 1, 0});

    mr::Sampler sampler(42);
    mr::nn::MLP model(2, {3, 3, 1}, sampler);

    mr::Value loss = model.loss(inputs, targets);
    loss.backward();

    std::cout << "loss: " << loss << std::endl;
    std::cout << "parameters: " << model.num_parameters() << std::endl;
    for (const auto& p : model.parameters()) std::cout << "  " << p << std::endl;
}
