#include "cascade/middleware/helpers.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cascade::middleware
{
auto asMiddleware(Function t_fn, std::string t_name) -> std::shared_ptr<MiddlewareFunction>
{
    return std::make_shared<MiddlewareFunction>(std::move(t_fn), std::move(t_name));
}

auto toMiddleware(MiddlewareItem t_item) -> MiddlewarePtr
{
    if (auto* fn = std::get_if<Function>(&t_item)) {
        return asMiddleware(std::move(*fn));
    }

    return std::get<MiddlewarePtr>(std::move(t_item));
}

auto chainOf(std::vector<MiddlewareItem> t_items) -> std::shared_ptr<MiddlewareChain>
{
    return collectionOf<MiddlewareChain>(std::move(t_items));
}

auto Decorator::operator()(MiddlewareItem t_inner) const -> std::shared_ptr<MiddlewareChain>
{
    if (const auto* inner = std::get_if<MiddlewarePtr>(&t_inner)) {
        if (auto chain = std::dynamic_pointer_cast<MiddlewareChain>(*inner)) {
            chain->add(m_outer);
            return chain;
        }
    }

    return chainOf({std::move(t_inner), m_outer});
}

Decorator::Decorator(MiddlewarePtr t_outer) : m_outer(std::move(t_outer))
{
    if (!m_outer) {
        throw std::invalid_argument{"Not a middleware"};
    }
}

auto middleware(MiddlewareItem t_outer) -> Decorator
{
    return Decorator{toMiddleware(std::move(t_outer))};
}

ChainBuilder::ChainBuilder(MiddlewareItem t_handler) : m_handler(toMiddleware(std::move(t_handler)))
{
    if (!m_handler) {
        throw std::invalid_argument{"Not a middleware"};
    }
}

auto ChainBuilder::prepend(MiddlewareItem t_middleware) const -> ChainBuilder
{
    auto outer = toMiddleware(std::move(t_middleware));
    if (!outer) {
        throw std::invalid_argument{"Not a middleware"};
    }

    auto prepended = m_prepended;
    prepended.push_back(std::move(outer));

    return ChainBuilder{m_handler, std::move(prepended)};
}

auto ChainBuilder::build() const -> std::shared_ptr<MiddlewareChain>
{
    auto chain = std::make_shared<MiddlewareChain>();

    if (const auto handlerChain = std::dynamic_pointer_cast<MiddlewareChain>(m_handler)) {
        for (const auto& member: handlerChain->collection()) {
            chain->add(member);
        }
    } else {
        chain->add(m_handler);
    }

    for (const auto& outer: m_prepended) {
        chain->add(outer);
    }

    return chain;
}
}  // namespace cascade::middleware
