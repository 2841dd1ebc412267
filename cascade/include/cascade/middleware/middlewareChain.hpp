#pragma once

#include "cascade/middleware/middlewareCollection.hpp"

namespace cascade::middleware
{
// The last added middleware runs first, the first added one right before the terminal next.
class MiddlewareChain : public MiddlewareCollection
{
public:
    auto add(MiddlewarePtr t_middleware) -> MiddlewarePtr override;

    auto run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender override;
};
}  // namespace cascade::middleware
