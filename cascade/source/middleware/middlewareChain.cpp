#include "cascade/middleware/middlewareChain.hpp"

#include <cstddef>
#include <memory>

#include "cascade/common/resultSender.hpp"

namespace cascade::middleware
{
namespace
{
using Members = std::shared_ptr<const MiddlewareCollection::Collection>;

// Runs the member at t_index - 1, its next runs the member before it, down to t_terminal.
auto dispatch(const Members& t_members, std::size_t t_index, const Next& t_terminal, Arguments t_args,
              ContextPtr t_ctx) -> ResultSender
{
    if (t_index == 0) {
        return t_terminal(std::move(t_args), std::move(t_ctx));
    }

    Next next = [t_members, t_index, t_terminal](Arguments t_nextArgs, ContextPtr t_nextCtx) -> ResultSender {
        return common::deferResult<Result>(
            [t_members, t_index, t_terminal, args = std::move(t_nextArgs), ctx = std::move(t_nextCtx)]() mutable {
                return dispatch(t_members, t_index - 1, t_terminal, std::move(args), std::move(ctx));
            });
    };

    return (*t_members)[t_index - 1]->run(std::move(t_args), std::move(t_ctx), std::move(next));
}
}  // namespace

auto MiddlewareChain::add(MiddlewarePtr t_middleware) -> MiddlewarePtr
{
    MiddlewareCollection::add(t_middleware);

    if (size() == 1) {
        adoptSource(t_middleware->fn(), t_middleware->name());
        CASCADE_LOG_TRACE(m_logger, "Chain adopted source '{}'", name());
    }

    return t_middleware;
}

auto MiddlewareChain::run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender
{
    auto members = std::make_shared<const Collection>(collection());

    CASCADE_LOG_TRACE(m_logger, "Running chain '{}' of {} middleware", name(), members->size());

    return common::deferResult<Result>(
        [members = std::move(members), next = std::move(t_next), args = std::move(t_args),
         ctx = std::move(t_ctx)]() mutable {
            return dispatch(members, members->size(), next, std::move(args), std::move(ctx));
        });
}
}  // namespace cascade::middleware
