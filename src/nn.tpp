#include <string>

namespace mr {

namespace nn {

inline void Module::zero_grad() {
    for (auto& p : parameters()) p.zero_grad();
}

inline std::vector<Value> to_values(const std::vector<double>& xs) {
    std::vector<Value> result;
    result.reserve(xs.size());
    for (double x : xs) result.emplace_back(x);
    return result;
}

/// Neuron ///

inline Neuron::Neuron(size_t nin, bool nonlinear, Sampler& sampler)
    : m_nonlinear(nonlinear) {
    // one independent draw per weight, then one for the bias
    m_weights.reserve(nin);
    for (size_t i = 0; i < nin; ++i) m_weights.emplace_back(sampler());
    m_bias = Value(sampler());
}

inline Value Neuron::evaluate(const std::vector<Value>& inputs) const {
    if (inputs.size() != m_weights.size()) {
        throw MRException("Neuron expects " + std::to_string(m_weights.size()) +
                          " inputs, got " + std::to_string(inputs.size()));
    }
    Value act = m_bias;
    for (size_t i = 0; i < m_weights.size(); ++i)
        act = act + m_weights[i] * inputs[i];
    if (m_nonlinear) return tanh(act);
    return act;
}

inline std::vector<Value> Neuron::parameters() const {
    std::vector<Value> result = m_weights;
    result.push_back(m_bias);
    return result;
}

/// Layer ///

inline Layer::Layer(size_t nin, size_t nout, bool nonlinear, Sampler& sampler)
    : m_nin(nin) {
    m_neurons.reserve(nout);
    for (size_t i = 0; i < nout; ++i)
        m_neurons.emplace_back(nin, nonlinear, sampler);
}

inline std::vector<Value> Layer::evaluate(
    const std::vector<Value>& inputs) const {
    std::vector<Value> outputs;
    outputs.reserve(m_neurons.size());
    for (const auto& neuron : m_neurons)
        outputs.push_back(neuron.evaluate(inputs));
    return outputs;
}

inline std::vector<Value> Layer::parameters() const {
    std::vector<Value> result;
    for (const auto& neuron : m_neurons) {
        std::vector<Value> params = neuron.parameters();
        result.insert(result.end(), params.begin(), params.end());
    }
    return result;
}

/// MLP ///

inline MLP::MLP(size_t nin, const std::vector<size_t>& widths,
                Sampler& sampler) {
    if (widths.empty()) {
        throw MRException("MLP needs at least one layer");
    }
    m_layers.reserve(widths.size());
    size_t in = nin;
    for (size_t i = 0; i < widths.size(); ++i) {
        if (widths[i] == 0) {
            throw MRException("MLP layer " + std::to_string(i) +
                              " has no neurons");
        }
        m_layers.emplace_back(in, widths[i], i + 1 != widths.size(), sampler);
        in = widths[i];
    }
}

inline std::vector<Value> MLP::evaluate(
    const std::vector<Value>& inputs) const {
    std::vector<Value> out = inputs;
    for (const auto& layer : m_layers) out = layer.evaluate(out);
    return out;
}

inline Value MLP::loss(const std::vector<std::vector<Value>>& batch_inputs,
                       const std::vector<Value>& batch_targets) const {
    if (batch_inputs.size() != batch_targets.size()) {
        throw MRException("loss() got " + std::to_string(batch_inputs.size()) +
                          " inputs but " +
                          std::to_string(batch_targets.size()) + " targets");
    }
    Value total(0.0);
    for (size_t i = 0; i < batch_inputs.size(); ++i) {
        Value out = evaluate(batch_inputs[i])[0];
        total = total + power(out - batch_targets[i], 2);
    }
    return total;
}

inline std::vector<Value> MLP::parameters() const {
    std::vector<Value> result;
    for (const auto& layer : m_layers) {
        std::vector<Value> params = layer.parameters();
        result.insert(result.end(), params.begin(), params.end());
    }
    return result;
}

};  // namespace nn

};  // namespace mr
