#pragma once

#include <cstddef>
#include <vector>

#include "microrunn/random.h"
#include "microrunn/value.h"

namespace mr {

namespace nn {

// Anything that owns trainable leaves
class Module {
   public:
    virtual ~Module() = default;

    virtual std::vector<Value> parameters() const = 0;

    void zero_grad();
    size_t num_parameters() const { return parameters().size(); }
};

class Neuron : public Module {
   private:
    std::vector<Value> m_weights;
    Value m_bias;
    bool m_nonlinear;

   public:
    Neuron(size_t nin, bool nonlinear, Sampler& sampler);

    // bias + sum(w_i * x_i), through tanh if the neuron is nonlinear
    Value evaluate(const std::vector<Value>& inputs) const;
    Value operator()(const std::vector<Value>& inputs) const {
        return evaluate(inputs);
    }

    std::vector<Value> parameters() const override;

    size_t input_size() const { return m_weights.size(); }
    bool nonlinear() const { return m_nonlinear; }
    const std::vector<Value>& weights() const { return m_weights; }
    const Value& bias() const { return m_bias; }
};

class Layer : public Module {
   private:
    size_t m_nin;
    std::vector<Neuron> m_neurons;

   public:
    Layer(size_t nin, size_t nout, bool nonlinear, Sampler& sampler);

    // one output per neuron, all built from the same inputs
    std::vector<Value> evaluate(const std::vector<Value>& inputs) const;
    std::vector<Value> operator()(const std::vector<Value>& inputs) const {
        return evaluate(inputs);
    }

    std::vector<Value> parameters() const override;

    size_t input_size() const { return m_nin; }
    size_t output_size() const { return m_neurons.size(); }
    const std::vector<Neuron>& neurons() const { return m_neurons; }
};

// Multi-layer perceptron. Every layer but the last one applies tanh, the
// last one is linear.
class MLP : public Module {
   private:
    std::vector<Layer> m_layers;

   public:
    MLP(size_t nin, const std::vector<size_t>& widths, Sampler& sampler);

    std::vector<Value> evaluate(const std::vector<Value>& inputs) const;
    std::vector<Value> operator()(const std::vector<Value>& inputs) const {
        return evaluate(inputs);
    }

    // Sum of squared errors of the first output over a batch, as a single
    // node to call backward() on
    Value loss(const std::vector<std::vector<Value>>& batch_inputs,
               const std::vector<Value>& batch_targets) const;

    std::vector<Value> parameters() const override;

    size_t input_size() const { return m_layers.front().input_size(); }
    size_t output_size() const { return m_layers.back().output_size(); }
    const std::vector<Layer>& layers() const { return m_layers; }
};

// wraps plain numbers as leaves, e.g. to build a batch of inputs
std::vector<Value> to_values(const std::vector<double>& xs);

};  // namespace nn

};  // namespace mr

#include "nn.tpp"
