#ifndef IRCDCC_UTILS_DEFER_HPP_
#define IRCDCC_UTILS_DEFER_HPP_

#include <utility>

namespace ircdcc::utils
{
// Runs a callable when the enclosing scope is left, unless dismissed first
template<typename F>
class Defer
{
public:
    explicit Defer(F call)
        : call_ {std::move(call)}
        , armed_ {true}
    {}

    ~Defer()
    {
        if (armed_)
        {
            call_();
        }
    }

    Defer(const Defer &) = delete;
    Defer &operator=(const Defer &) = delete;

    void dismiss()
    {
        armed_ = false;
    }

private:
    F    call_;
    bool armed_;
};
}  // namespace ircdcc::utils

#define IRCDCC_DEFER_CONCAT_IMPL(a, b) a##b
#define IRCDCC_DEFER_CONCAT(a, b)      IRCDCC_DEFER_CONCAT_IMPL(a, b)

// Statements given to DEFER run at scope exit and capture everything by reference
#define DEFER(...)                                                         \
    ::ircdcc::utils::Defer IRCDCC_DEFER_CONCAT(defer_at_line_, __LINE__) { \
        [&] { __VA_ARGS__; }                                               \
    }

#endif  // IRCDCC_UTILS_DEFER_HPP_
