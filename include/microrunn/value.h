#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "microrunn/types.h"
#include "microrunn/util.h"

namespace mr {

template <typename T>
class _ValueWrapper;

using Value = _ValueWrapper<double>;

// composed from the primitives below, used by the operators
template <typename T>
_ValueWrapper<T> negate(const _ValueWrapper<T>& obj);
template <typename T>
_ValueWrapper<T> subtract(const _ValueWrapper<T>& lhs,
                          const _ValueWrapper<T>& rhs);
template <typename T>
_ValueWrapper<T> divide(const _ValueWrapper<T>& lhs,
                        const _ValueWrapper<T>& rhs);

#define MR_CLASS_FUNCTIONS                                                 \
    template <typename A>                                                  \
    friend _ValueWrapper<A> add(const _ValueWrapper<A>& lhs,               \
                                const _ValueWrapper<A>& rhs);              \
    template <typename A>                                                  \
    friend _ValueWrapper<A> multiply(const _ValueWrapper<A>& lhs,          \
                                     const _ValueWrapper<A>& rhs);         \
    template <typename A>                                                  \
    friend _ValueWrapper<A> power(const _ValueWrapper<A>& base,            \
                                  detail::identity_t<A> exponent);         \
    template <typename A>                                                  \
    friend _ValueWrapper<A> tanh(const _ValueWrapper<A>& obj);

template <typename T, typename = std::enable_if_t<std::is_floating_point_v<T>>>
class _ValueData {
   public:
    template <typename A>
    friend class _ValueWrapper;

    using ptr = std::shared_ptr<_ValueData<T>>;

    MR_CLASS_FUNCTIONS

    ~_ValueData() {
        // unlink operand chains iteratively so that dropping the root of a
        // very deep graph does not recurse once per node
        std::vector<ptr> pending;
        pending.swap(m_children);
        while (!pending.empty()) {
            ptr node = std::move(pending.back());
            pending.pop_back();
            if (node && node.use_count() == 1) {
                for (auto& child : node->m_children)
                    pending.push_back(std::move(child));
                node->m_children.clear();
            }
        }
    }

   private:
    T m_value;
    T m_grad;
    bool m_requires_grad;
    Operation<T> m_op;
    std::vector<ptr> m_children;

    _ValueData(T value, Operation<T> op, std::vector<ptr> children,
               bool requires_grad = true)
        : m_value(value),
          m_grad(0),
          m_requires_grad(requires_grad),
          m_op(op),
          m_children(std::move(children)) {}

    _ValueData<T>& child(size_t i) const { return *m_children[i]; }

    void accumulate(T delta) {
        if (m_requires_grad) m_grad += delta;
    }

    // Adds this node's contribution to the gradient of each operand. Must
    // only run once m_grad holds the contributions of every consumer.
    void backward_step() {
        std::visit(
            detail::overloaded{
                [](const op::Leaf&) {},
                [this](const op::Add&) {
                    child(0).accumulate(m_grad);
                    child(1).accumulate(m_grad);
                },
                [this](const op::Mul&) {
                    child(0).accumulate(child(1).m_value * m_grad);
                    child(1).accumulate(child(0).m_value * m_grad);
                },
                [this](const op::Pow<T>& p) {
                    child(0).accumulate(
                        detail::pow_grad(child(0).m_value, p.exponent) *
                        m_grad);
                },
                [this](const op::Tanh&) {
                    child(0).accumulate(detail::tanh_grad(m_value) * m_grad);
                }},
            m_op);
    }
};

template <typename T>
class _ValueWrapper {
   private:
    std::shared_ptr<_ValueData<T>> m_ptr;

    template <typename A>
    friend class _ValueWrapper;

    static _ValueWrapper<T> wrap(std::shared_ptr<_ValueData<T>> ptr) {
        _ValueWrapper<T> result;
        result.m_ptr = std::move(ptr);
        return result;
    }

    static _ValueWrapper<T> make(
        T value, Operation<T> op,
        std::vector<std::shared_ptr<_ValueData<T>>> children) {
        return wrap(std::shared_ptr<_ValueData<T>>(
            new _ValueData<T>(value, op, std::move(children))));
    }

    void print_expression(std::ostream& o) const;

   public:
    // empty handle, only useful as a placeholder to assign to later
    _ValueWrapper() = default;

    // leaf node
    explicit _ValueWrapper(T value)
        : m_ptr(new _ValueData<T>(value, op::Leaf{}, {})) {}

    // leaf node that never receives a gradient, used for plain numbers
    // mixed into expressions
    static _ValueWrapper<T> Constant(T x) {
        _ValueWrapper<T> result(x);
        result.m_ptr->m_requires_grad = false;
        return result;
    }

    bool empty() const { return !m_ptr; }
    const T& value() const {
        MR_ENSURE_NOT_EMPTY(*this, "value()");
        return m_ptr->m_value;
    }
    T grad() const {
        MR_ENSURE_NOT_EMPTY(*this, "grad()");
        return m_ptr->m_grad;
    }
    bool requires_grad() const {
        MR_ENSURE_NOT_EMPTY(*this, "requires_grad()");
        return m_ptr->m_requires_grad;
    }
    const Operation<T>& operation() const {
        MR_ENSURE_NOT_EMPTY(*this, "operation()");
        return m_ptr->m_op;
    }
    std::string op_name() const;
    std::vector<_ValueWrapper<T>> children() const;

    // same node, not just the same value
    bool is(const _ValueWrapper<T>& other) const {
        return m_ptr == other.m_ptr;
    }

    // Every node reachable from this one, each exactly once, operands
    // before the nodes that use them. This node is last.
    std::vector<_ValueWrapper<T>> topological_order() const;

    // Fills in the gradient of this node with respect to every node it was
    // computed from. Gradients are added to whatever they hold already, so
    // a second call without zero_grad() in between doubles them.
    _ValueWrapper<T>& backward();

    // Sets the gradient of every reachable node back to zero
    void zero_grad();

    std::string expression() const;

    friend std::ostream& operator<<(std::ostream& o, const _ValueWrapper& v) {
        if (v.empty()) return o << "Value(empty)";
        o << "Value(data=" << v.value() << ", grad=" << v.grad() << ")";
        return o;
    }

    /// Operators ///

#define MR_MAKE_CONSTANT(x) _ValueWrapper<T>::Constant(static_cast<T>(x))
#define MR_TEMPLATE_NUMBER \
    template <typename B, typename = std::enable_if_t<detail::is_number_v<B>>>
    // a value may be combined with another value or with a plain number on
    // either side. plain numbers become constants
#define MR_BINARY_OP(op, fn)                                                  \
    friend _ValueWrapper<T> operator op(const _ValueWrapper<T>& lhs,          \
                                        const _ValueWrapper<T>& rhs) {        \
        return fn(lhs, rhs);                                                  \
    }                                                                         \
    MR_TEMPLATE_NUMBER                                                        \
    friend _ValueWrapper<T> operator op(const _ValueWrapper<T>& lhs, B rhs) { \
        return fn(lhs, MR_MAKE_CONSTANT(rhs));                                \
    }                                                                         \
    MR_TEMPLATE_NUMBER                                                        \
    friend _ValueWrapper<T> operator op(B lhs, const _ValueWrapper<T>& rhs) { \
        return fn(MR_MAKE_CONSTANT(lhs), rhs);                                \
    }

    MR_BINARY_OP(+, add)
    MR_BINARY_OP(-, subtract)
    MR_BINARY_OP(*, multiply)
    MR_BINARY_OP(/, divide)

    friend _ValueWrapper<T> operator-(const _ValueWrapper<T>& obj) {
        return negate(obj);
    }

    /// Other functions ///

    MR_CLASS_FUNCTIONS
};

};  // namespace mr

#include "value.tpp"
