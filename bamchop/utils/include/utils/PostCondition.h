#pragma once

#include <utility>

namespace bamchop::utils {

namespace detail {
template <typename Func>
class PostCondition {
public:
    PostCondition(Func&& func) : m_func(std::move(func)) {}
    ~PostCondition() { m_func(); }

private:
    Func m_func;
};
}  // namespace detail

// Runs |function| when the returned guard goes out of scope.
template <typename Func>
[[nodiscard]] auto PostCondition(Func function) {
    return detail::PostCondition(std::move(function));
}

}  // namespace bamchop::utils
