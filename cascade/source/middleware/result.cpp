#include "cascade/middleware/result.hpp"

#include <any>

namespace cascade::middleware
{
auto isSuccessfulResult(const Result& t_value) noexcept -> bool
{
    return !holds(t_value, MiddlewareResult::ignore);
}

auto holds(const Result& t_value, MiddlewareResult t_sentinel) noexcept -> bool
{
    const auto* sentinel = std::any_cast<MiddlewareResult>(&t_value);
    return sentinel != nullptr && *sentinel == t_sentinel;
}
}  // namespace cascade::middleware
