#pragma once

#include <cstdint>

namespace mr {

class Config {
   public:
    static Config& instance() {
        static Config config;
        return config;
    }

    // print warnings to std::cerr (see MR_LOG_WARNING)
    bool log_warnings = true;

    // default range and seed for parameter initialization
    double init_low = 0.01;
    double init_high = 1.0;
    std::uint64_t init_seed = 42;

   private:
    Config() = default;
};

};  // namespace mr
