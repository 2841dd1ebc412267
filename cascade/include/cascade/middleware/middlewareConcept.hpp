#pragma once

#include <concepts>
#include <utility>

#include "cascade/middleware/arguments.hpp"
#include "cascade/middleware/result.hpp"

namespace cascade::middleware
{
// A callable is usable as a middleware only when it hands back a sender, i.e. it can suspend.
template<typename F>
concept MiddlewareFunctionConcept = requires(F f, Arguments args, ContextPtr ctx, Next next) {
    { f(std::move(args), std::move(ctx), std::move(next)) } -> std::convertible_to<ResultSender>;
};
}  // namespace cascade::middleware
