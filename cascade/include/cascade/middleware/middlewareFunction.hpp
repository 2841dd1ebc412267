#pragma once

#include <string>

#include "cascade/middleware/middleware.hpp"

namespace cascade::middleware
{
// @throws std::invalid_argument if t_fn is empty
class MiddlewareFunction : public Middleware
{
public:
    explicit MiddlewareFunction(Function t_fn, std::string t_name = {});

    auto run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender override;
};
}  // namespace cascade::middleware
