#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <set>
#include <vector>

#include "microrunn/microrunn.h"

using mr::Value;
using mr::nn::Layer;
using mr::nn::MLP;
using mr::nn::Neuron;

namespace {

std::vector<std::vector<Value>> xor_inputs() {
    return {mr::nn::to_values({0, 0}), mr::nn::to_values({0, 1}),
            mr::nn::to_values({1, 0}), mr::nn::to_values({1, 1})};
}

}  // namespace

TEST(SamplerTest, DeterministicForASeed) {
    mr::Sampler a(7), b(7), c(8);
    std::vector<double> xs, ys, zs;
    for (int i = 0; i < 16; ++i) {
        xs.push_back(a());
        ys.push_back(b());
        zs.push_back(c());
    }
    EXPECT_EQ(xs, ys);
    EXPECT_NE(xs, zs);
    EXPECT_EQ(mr::sample(3, 0.01, 1.0), mr::sample(3, 0.01, 1.0));
}

TEST(SamplerTest, StaysInRange) {
    mr::Sampler sampler(42, 0.01, 1.0);
    for (int i = 0; i < 1000; ++i) {
        double x = sampler();
        EXPECT_GT(x, 0.01);
        EXPECT_LE(x, 1.0);
    }
}

TEST(SamplerTest, DefaultsComeFromConfig) {
    mr::Sampler sampler;
    EXPECT_EQ(sampler.low(), mr::Config::instance().init_low);
    EXPECT_EQ(sampler.high(), mr::Config::instance().init_high);
}

TEST(SamplerTest, EmptyRangeIsRejected) {
    EXPECT_THROW(mr::Sampler(1, 1.0, 1.0), mr::MRException);
    EXPECT_THROW(mr::Sampler(1, 2.0, 1.0), mr::MRException);
}

TEST(NeuronTest, CreatesOneWeightPerInput) {
    mr::Sampler sampler(42);
    Neuron n(6, true, sampler);
    EXPECT_EQ(n.weights().size(), 6u);
    EXPECT_EQ(n.input_size(), 6u);
    EXPECT_EQ(n.parameters().size(), 7u);
    EXPECT_TRUE(n.parameters().back().is(n.bias()));
}

TEST(NeuronTest, WeightsAreSampledIndependently) {
    mr::Sampler sampler(42);
    Neuron n(6, true, sampler);
    std::set<double> distinct;
    for (const auto& w : n.weights()) {
        EXPECT_NE(w.value(), 0.0);
        distinct.insert(w.value());
    }
    EXPECT_NE(n.bias().value(), 0.0);
    EXPECT_EQ(distinct.size(), 6u);
}

TEST(NeuronTest, EvaluatesWeightedSum) {
    mr::Sampler sampler(1);
    Neuron linear(3, false, sampler);
    Neuron squashed(3, true, sampler);
    std::vector<Value> x = mr::nn::to_values({0.5, -1.0, 2.0});

    double expected = linear.bias().value();
    for (size_t i = 0; i < 3; ++i)
        expected += linear.weights()[i].value() * x[i].value();
    Value out = linear(x);
    EXPECT_DOUBLE_EQ(out.value(), expected);
    EXPECT_EQ(out.grad(), 0.0);

    double pre = squashed.bias().value();
    for (size_t i = 0; i < 3; ++i)
        pre += squashed.weights()[i].value() * x[i].value();
    Value y = squashed.evaluate(x);
    EXPECT_EQ(y.op_name(), "tanh");
    EXPECT_DOUBLE_EQ(y.value(), std::tanh(pre));
}

TEST(NeuronTest, InputArityMismatchIsRejected) {
    mr::Sampler sampler(42);
    Neuron n(3, true, sampler);
    EXPECT_THROW(n.evaluate(mr::nn::to_values({1, 2})), mr::MRException);
    EXPECT_THROW(n.evaluate(mr::nn::to_values({1, 2, 3, 4})), mr::MRException);
}

TEST(NeuronTest, BackwardReachesParameters) {
    mr::Sampler sampler(42);
    Neuron n(3, true, sampler);
    Value out = n(mr::nn::to_values({0.2, 0.4, 0.6}));
    out.backward();
    EXPECT_NE(out.grad(), 0.0);
    for (const auto& p : n.parameters()) EXPECT_NE(p.grad(), 0.0);
}

TEST(LayerTest, OneOutputPerNeuron) {
    mr::Sampler sampler(42);
    Layer l(3, 4, true, sampler);
    auto out = l(mr::nn::to_values({0.1, 0.2, 0.3}));
    EXPECT_EQ(out.size(), 4u);
    EXPECT_EQ(l.output_size(), 4u);
    EXPECT_EQ(l.input_size(), 3u);
    EXPECT_EQ(l.parameters().size(), 16u);
}

TEST(MLPTest, ShapeAndParameterCount) {
    mr::Sampler sampler(42);
    MLP m(2, {3, 3, 1}, sampler);
    auto out = m(mr::nn::to_values({1.0, -1.0}));
    EXPECT_EQ(out.size(), 1u);
    ASSERT_EQ(m.layers().size(), 3u);
    EXPECT_EQ(m.parameters().size(), 25u);
    EXPECT_EQ(m.num_parameters(), 25u);
    EXPECT_EQ(m.input_size(), 2u);
    EXPECT_EQ(m.output_size(), 1u);
}

TEST(MLPTest, LastLayerIsLinear) {
    mr::Sampler sampler(42);
    MLP m(2, {3, 3, 1}, sampler);
    EXPECT_TRUE(m.layers()[0].neurons()[0].nonlinear());
    EXPECT_TRUE(m.layers()[1].neurons()[0].nonlinear());
    EXPECT_FALSE(m.layers()[2].neurons()[0].nonlinear());
    EXPECT_NE(m(mr::nn::to_values({1.0, 1.0}))[0].op_name(), "tanh");
}

TEST(MLPTest, InvalidWidthsAreRejected) {
    mr::Sampler sampler(42);
    EXPECT_THROW(MLP(2, {}, sampler), mr::MRException);
    EXPECT_THROW(MLP(2, {3, 0, 1}, sampler), mr::MRException);
}

TEST(MLPTest, SameSeedSameParameters) {
    mr::Sampler s1(5), s2(5);
    MLP a(2, {3, 1}, s1);
    MLP b(2, {3, 1}, s2);
    auto pa = a.parameters();
    auto pb = b.parameters();
    ASSERT_EQ(pa.size(), pb.size());
    for (size_t i = 0; i < pa.size(); ++i) {
        EXPECT_EQ(pa[i].value(), pb[i].value());
        EXPECT_FALSE(pa[i].is(pb[i]));
    }
}

TEST(MLPTest, LossIsNonNegative) {
    for (uint64_t seed : {1u, 2u, 3u, 42u}) {
        mr::Sampler sampler(seed);
        MLP m(2, {3, 3, 1}, sampler);
        Value loss = m.loss(xor_inputs(), mr::nn::to_values({0, 1, 1, 0}));
        EXPECT_GE(loss.value(), 0.0);
    }
}

TEST(MLPTest, LossIsSumOfSquaredErrors) {
    mr::Sampler sampler(42);
    MLP m(2, {3, 3, 1}, sampler);
    auto inputs = xor_inputs();
    std::vector<double> targets = {0, 1, 1, 0};

    double expected = 0;
    for (size_t i = 0; i < inputs.size(); ++i) {
        double diff = m(inputs[i])[0].value() - targets[i];
        expected += diff * diff;
    }
    Value loss = m.loss(inputs, mr::nn::to_values(targets));
    EXPECT_NEAR(loss.value(), expected, 1e-12);
}

TEST(MLPTest, EmptyBatchHasZeroLoss) {
    mr::Sampler sampler(42);
    MLP m(2, {1}, sampler);
    Value loss = m.loss({}, {});
    EXPECT_EQ(loss.value(), 0.0);
    EXPECT_NO_THROW(loss.backward());
}

TEST(MLPTest, BatchSizeMismatchIsRejected) {
    mr::Sampler sampler(42);
    MLP m(2, {1}, sampler);
    EXPECT_THROW(m.loss(xor_inputs(), mr::nn::to_values({0, 1})),
                 mr::MRException);
}

// a single linear neuron: loss = sum_k (b + w x_k - y_k)^2, so
// dL/dw = sum_k 2 (out_k - y_k) x_k and dL/db = sum_k 2 (out_k - y_k)
TEST(MLPTest, GradientsAccumulateOverTheBatch) {
    mr::Sampler sampler(42);
    MLP m(1, {1}, sampler);
    const Value& w = m.layers()[0].neurons()[0].weights()[0];
    const Value& b = m.layers()[0].neurons()[0].bias();

    std::vector<double> xs = {0.5, -1.0, 2.0};
    std::vector<double> ys = {1.0, 0.0, -1.0};
    std::vector<std::vector<Value>> inputs;
    for (double x : xs) inputs.push_back(mr::nn::to_values({x}));

    Value loss = m.loss(inputs, mr::nn::to_values(ys));
    loss.backward();

    double dw = 0, db = 0;
    for (size_t k = 0; k < xs.size(); ++k) {
        double out = b.value() + w.value() * xs[k];
        dw += 2 * (out - ys[k]) * xs[k];
        db += 2 * (out - ys[k]);
    }
    EXPECT_NEAR(w.grad(), dw, 1e-12);
    EXPECT_NEAR(b.grad(), db, 1e-12);
}

TEST(MLPTest, ZeroGradResetsParameters) {
    mr::Sampler sampler(42);
    MLP m(2, {3, 3, 1}, sampler);
    Value loss = m.loss(xor_inputs(), mr::nn::to_values({0, 1, 1, 0}));
    loss.backward();

    bool any_nonzero = false;
    for (const auto& p : m.parameters()) any_nonzero |= p.grad() != 0.0;
    EXPECT_TRUE(any_nonzero);

    m.zero_grad();
    for (const auto& p : m.parameters()) EXPECT_EQ(p.grad(), 0.0);
}
