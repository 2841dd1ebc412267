#pragma once

#include "cascade/middleware/middlewareCollection.hpp"

namespace cascade::middleware
{
// Runs every member with the same next and returns all their Results, ignored ones included.
class AllOfAll : public MiddlewareCollection
{
public:
    auto run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender override;
};
}  // namespace cascade::middleware
