#ifndef LANSHARE_UTILS_DEFER_HPP_
#define LANSHARE_UTILS_DEFER_HPP_

#include <utility>

namespace lanshare::utils
{
/// Invokes a callable when leaving the enclosing scope, unless dismissed first.
template<typename F>
class Defer
{
public:
    explicit Defer(F call)
        : call_ {std::move(call)}
        , armed_ {true}
    {}

    Defer(const Defer &) = delete;
    Defer &operator=(const Defer &) = delete;

    ~Defer()
    {
        if (armed_)
        {
            call_();
        }
    }

    void dismiss()
    {
        armed_ = false;
    }

private:
    F    call_;
    bool armed_;
};
}  // namespace lanshare::utils

#define LANSHARE_DEFER_CONCAT_IMPL(a, b) a##b
#define LANSHARE_DEFER_CONCAT(a, b)      LANSHARE_DEFER_CONCAT_IMPL(a, b)
#define DEFER(...)                                                           \
    ::lanshare::utils::Defer LANSHARE_DEFER_CONCAT(defer_at_line_, __LINE__) \
    {                                                                        \
        [&] { __VA_ARGS__; }                                                 \
    }

#endif  // LANSHARE_UTILS_DEFER_HPP_
