#pragma once

#include <any>
#include <utility>
#include <vector>

#include "cascade/common/resultSender.hpp"

namespace cascade::middleware
{
// Anything but ignore, an empty Result included, counts as success.
enum class MiddlewareResult
{
    ok,
    ignore
};

using Result = std::any;
using Results = std::vector<Result>;
using ResultSender = common::ResultSender<Result>;

[[nodiscard]] auto isSuccessfulResult(const Result& t_value) noexcept -> bool;

// Matches only a Result holding the given sentinel.
[[nodiscard]] auto holds(const Result& t_value, MiddlewareResult t_sentinel) noexcept -> bool;

[[nodiscard]] inline auto ready(Result t_value) -> ResultSender
{
    return common::justResult<Result>(std::move(t_value));
}

[[nodiscard]] inline auto ready(MiddlewareResult t_sentinel) -> ResultSender
{
    return ready(Result{t_sentinel});
}
}  // namespace cascade::middleware
