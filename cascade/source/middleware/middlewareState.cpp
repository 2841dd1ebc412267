#include "cascade/middleware/middlewareState.hpp"

#include <any>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <utility>

#include "cascade/common/resultSender.hpp"

namespace cascade::middleware
{
MiddlewareState::MiddlewareState(PerRunTag /*unused*/, std::type_index t_type, Provider t_provider,
                                 std::optional<std::string> t_key)
    : m_type(t_type), m_provider(std::move(t_provider)), m_key(std::move(t_key)), m_perRun(true)
{}

auto MiddlewareState::run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender
{
    return common::deferResult<Result>([type = m_type, provider = m_provider, key = m_key, args = std::move(t_args),
                                        ctx = std::move(t_ctx), next = std::move(t_next)]() mutable -> ResultSender {
        if (!ctx) {
            throw std::invalid_argument{"Missing context"};
        }

        auto state = provider();

        if (key && !key->empty()) {
            args.keyword.insert_or_assign(*key, state);
        }
        setState(*ctx, type, std::move(state));

        return next(std::move(args), std::move(ctx));
    });
}

auto MiddlewareState::setState(Context& t_ctx, std::type_index t_type, std::any t_state) -> void
{
    t_ctx.states().insert_or_assign(t_type, std::move(t_state));
}
}  // namespace cascade::middleware
