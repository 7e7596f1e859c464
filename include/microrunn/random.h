#pragma once

#include <cstdint>
#include <random>

#include "microrunn/config.h"
#include "microrunn/util.h"

namespace mr {

// Seeded source of initial parameter values in (low, high]. Passed to the
// network constructors so that runs are reproducible and independent of
// each other.
class Sampler {
   private:
    std::mt19937_64 m_generator;
    std::uniform_real_distribution<double> m_distribution;
    double m_low, m_high;

   public:
    explicit Sampler(std::uint64_t seed = Config::instance().init_seed,
                     double low = Config::instance().init_low,
                     double high = Config::instance().init_high)
        : m_generator(seed), m_low(low), m_high(high) {
        if (!(low < high)) {
            throw MRException("Sampler range is empty: low must be below high");
        }
        m_distribution = std::uniform_real_distribution<double>(low, high);
    }

    double operator()() {
        // the distribution draws from [low, high), mirror it onto (low, high]
        return m_high - (m_distribution(m_generator) - m_low);
    }

    double low() const { return m_low; }
    double high() const { return m_high; }
};

inline double sample(std::uint64_t seed, double low, double high) {
    Sampler sampler(seed, low, high);
    return sampler();
}

};  // namespace mr
