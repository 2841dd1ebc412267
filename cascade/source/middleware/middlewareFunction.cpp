#include "cascade/middleware/middlewareFunction.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace cascade::middleware
{
MiddlewareFunction::MiddlewareFunction(Function t_fn, std::string t_name)
{
    if (!t_fn) {
        throw std::invalid_argument{"Not a middleware function"};
    }

    adoptSource(std::make_shared<const Function>(std::move(t_fn)), std::move(t_name));
}

auto MiddlewareFunction::run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender
{
    return (*fn())(std::move(t_args), std::move(t_ctx), std::move(t_next));
}
}  // namespace cascade::middleware
