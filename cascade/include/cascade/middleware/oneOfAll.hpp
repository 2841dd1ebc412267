#pragma once

#include "cascade/middleware/middlewareCollection.hpp"

namespace cascade::middleware
{
class OneOfAll : public MiddlewareCollection
{
public:
    auto run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender override;
};
}  // namespace cascade::middleware
