#pragma once

#include <cmath>
#include <exception>
#include <iostream>
#include <string>

#include "microrunn/config.h"
#include "microrunn/types.h"

#define MR_LOG_WARNING(msg)                                         \
    do {                                                            \
        if (::mr::Config::instance().log_warnings) {                \
            std::cerr << "[microrunn] warning: " << msg << std::endl; \
        }                                                           \
    } while (0)

#define MR_ENSURE_NOT_EMPTY(x, fn)                                       \
    if (!(x).m_ptr) {                                                    \
        throw ::mr::MRException(std::string(fn) +                        \
                                " called on an empty value handle");     \
    }

#define MR_ENSURE_REQUIRES_GRAD(x)                                     \
    if (!(x).m_ptr->m_requires_grad) {                                 \
        throw ::mr::MRException(                                       \
            "Tried calling backward on a node without gradient");      \
    }

namespace mr {

class MRException : public std::exception {
   private:
    std::string m_message;

   public:
    MRException(const std::string& message) : m_message(message) {}

    virtual const char* what() const noexcept override {
        return m_message.c_str();
    }
};

namespace detail {

// d/dx x^n = n*x^(n-1)
template <typename T>
T pow_grad(const T& base, const T& exponent) {
    return exponent * std::pow(base, exponent - 1);
}

// d/dx tanh(x) = 1 - tanh(x)^2, written in terms of the forward output
template <typename T>
T tanh_grad(const T& out) {
    return 1 - out * out;
}

};  // namespace detail
};  // namespace mr
