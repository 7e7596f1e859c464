#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace mr {

/// Construction ///

template <typename T = double>
_ValueWrapper<T> leaf(detail::identity_t<T> x) {
    return _ValueWrapper<T>(x);
}

template <typename T>
_ValueWrapper<T> add(const _ValueWrapper<T>& lhs, const _ValueWrapper<T>& rhs) {
    MR_ENSURE_NOT_EMPTY(lhs, "add()");
    MR_ENSURE_NOT_EMPTY(rhs, "add()");
    return _ValueWrapper<T>::make(lhs.m_ptr->m_value + rhs.m_ptr->m_value,
                                  op::Add{}, {lhs.m_ptr, rhs.m_ptr});
}

template <typename T>
_ValueWrapper<T> multiply(const _ValueWrapper<T>& lhs,
                          const _ValueWrapper<T>& rhs) {
    MR_ENSURE_NOT_EMPTY(lhs, "multiply()");
    MR_ENSURE_NOT_EMPTY(rhs, "multiply()");
    return _ValueWrapper<T>::make(lhs.m_ptr->m_value * rhs.m_ptr->m_value,
                                  op::Mul{}, {lhs.m_ptr, rhs.m_ptr});
}

// a negative base with a non-integer exponent gives NaN, which is kept
template <typename T>
_ValueWrapper<T> power(const _ValueWrapper<T>& base,
                       detail::identity_t<T> exponent) {
    MR_ENSURE_NOT_EMPTY(base, "power()");
    return _ValueWrapper<T>::make(std::pow(base.m_ptr->m_value, exponent),
                                  op::Pow<T>{exponent}, {base.m_ptr});
}

template <typename T>
_ValueWrapper<T> tanh(const _ValueWrapper<T>& obj) {
    MR_ENSURE_NOT_EMPTY(obj, "tanh()");
    return _ValueWrapper<T>::make(std::tanh(obj.m_ptr->m_value), op::Tanh{},
                                  {obj.m_ptr});
}

template <typename T>
_ValueWrapper<T> negate(const _ValueWrapper<T>& obj) {
    return multiply(obj, _ValueWrapper<T>::Constant(-1));
}

template <typename T>
_ValueWrapper<T> subtract(const _ValueWrapper<T>& lhs,
                          const _ValueWrapper<T>& rhs) {
    return add(lhs, negate(rhs));
}

template <typename T>
_ValueWrapper<T> divide(const _ValueWrapper<T>& lhs,
                        const _ValueWrapper<T>& rhs) {
    return multiply(lhs, power(rhs, -1));
}

/// Inspection ///

template <typename T>
std::string _ValueWrapper<T>::op_name() const {
    MR_ENSURE_NOT_EMPTY(*this, "op_name()");
    return std::visit(detail::overloaded{
                          [](const op::Leaf&) { return std::string("leaf"); },
                          [](const op::Add&) { return std::string("+"); },
                          [](const op::Mul&) { return std::string("*"); },
                          [](const op::Pow<T>&) { return std::string("**"); },
                          [](const op::Tanh&) { return std::string("tanh"); }},
                      m_ptr->m_op);
}

template <typename T>
std::vector<_ValueWrapper<T>> _ValueWrapper<T>::children() const {
    MR_ENSURE_NOT_EMPTY(*this, "children()");
    std::vector<_ValueWrapper<T>> result;
    result.reserve(m_ptr->m_children.size());
    for (const auto& child : m_ptr->m_children)
        result.push_back(_ValueWrapper<T>::wrap(child));
    return result;
}

template <typename T>
void _ValueWrapper<T>::print_expression(std::ostream& o) const {
    const auto& children = m_ptr->m_children;
    std::visit(
        detail::overloaded{
            [&](const op::Leaf&) { o << m_ptr->m_value; },
            [&](const op::Add&) {
                o << "(";
                wrap(children[0]).print_expression(o);
                o << " + ";
                wrap(children[1]).print_expression(o);
                o << ")";
            },
            [&](const op::Mul&) {
                o << "(";
                wrap(children[0]).print_expression(o);
                o << " * ";
                wrap(children[1]).print_expression(o);
                o << ")";
            },
            [&](const op::Pow<T>& p) {
                o << "(";
                wrap(children[0]).print_expression(o);
                o << " ** " << p.exponent << ")";
            },
            [&](const op::Tanh&) {
                o << "tanh(";
                wrap(children[0]).print_expression(o);
                o << ")";
            }},
        m_ptr->m_op);
}

template <typename T>
std::string _ValueWrapper<T>::expression() const {
    MR_ENSURE_NOT_EMPTY(*this, "expression()");
    std::ostringstream o;
    print_expression(o);
    return o.str();
}

/// Backward pass ///

template <typename T>
std::vector<_ValueWrapper<T>> _ValueWrapper<T>::topological_order() const {
    MR_ENSURE_NOT_EMPTY(*this, "topological_order()");
    using node_ptr = std::shared_ptr<_ValueData<T>>;

    std::vector<_ValueWrapper<T>> order;
    // nodes are deduplicated by identity: a node reached through two
    // consumers is still appended once
    std::unordered_set<const _ValueData<T>*> visited;
    // explicit stack of (node, index of the next operand to visit)
    std::vector<std::pair<node_ptr, size_t>> stack;

    visited.insert(m_ptr.get());
    stack.emplace_back(m_ptr, 0);
    while (!stack.empty()) {
        node_ptr node = stack.back().first;
        size_t next = stack.back().second;
        if (next < node->m_children.size()) {
            ++stack.back().second;
            const node_ptr& child = node->m_children[next];
            if (visited.insert(child.get()).second)
                stack.emplace_back(child, 0);
        } else {
            order.push_back(wrap(node));
            stack.pop_back();
        }
    }
    return order;
}

template <typename T>
_ValueWrapper<T>& _ValueWrapper<T>::backward() {
    MR_ENSURE_NOT_EMPTY(*this, "backward()");
    MR_ENSURE_REQUIRES_GRAD(*this);

    std::vector<_ValueWrapper<T>> order = topological_order();
    // checked here as well as in MR_LOG_WARNING to skip the scan when
    // warnings are off
    if (Config::instance().log_warnings &&
        std::any_of(order.begin(), order.end(), [](const auto& v) {
            return v.m_ptr->m_grad != 0;
        })) {
        MR_LOG_WARNING(
            "backward() found gradients left by a previous pass, the new "
            "contributions are added to them. Call zero_grad() first");
    }

    m_ptr->m_grad = 1;
    // reverse post-order: a node is processed only after all of its
    // consumers have added their contribution to it
    for (auto it = order.rbegin(); it != order.rend(); ++it)
        it->m_ptr->backward_step();
    return *this;
}

template <typename T>
void _ValueWrapper<T>::zero_grad() {
    MR_ENSURE_NOT_EMPTY(*this, "zero_grad()");
    for (auto& v : topological_order()) v.m_ptr->m_grad = 0;
}

};  // namespace mr
