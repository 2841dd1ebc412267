#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "cascade/middleware/middleware.hpp"
#include "cascade/middleware/middlewareChain.hpp"
#include "cascade/middleware/middlewareCollection.hpp"
#include "cascade/middleware/middlewareConcept.hpp"
#include "cascade/middleware/middlewareFunction.hpp"

namespace cascade::middleware
{
using MiddlewareItem = std::variant<MiddlewarePtr, Function>;

// Always wraps, even a function taken from another middleware.
[[nodiscard]] auto asMiddleware(Function t_fn, std::string t_name = {}) -> std::shared_ptr<MiddlewareFunction>;

template<MiddlewareFunctionConcept F>
    requires(!std::same_as<std::decay_t<F>, Function>)
[[nodiscard]] auto asMiddleware(F&& t_fn, std::string t_name = {}) -> std::shared_ptr<MiddlewareFunction>
{
    return asMiddleware(Function{std::forward<F>(t_fn)}, std::move(t_name));
}

// Functions get converted, middleware are passed through.
[[nodiscard]] auto toMiddleware(MiddlewareItem t_item) -> MiddlewarePtr;

template<std::derived_from<MiddlewareCollection> C>
    requires std::is_default_constructible_v<C>
[[nodiscard]] auto collectionOf(std::vector<MiddlewareItem> t_items) -> std::shared_ptr<C>
{
    auto collection = std::make_shared<C>();

    for (auto& item: t_items) {
        collection->add(toMiddleware(std::move(item)));
    }

    return collection;
}

[[nodiscard]] auto chainOf(std::vector<MiddlewareItem> t_items) -> std::shared_ptr<MiddlewareChain>;

// Grows t_inner in place when it is a chain, otherwise builds chain {t_inner, outer}.
class Decorator
{
public:
    // @throws std::invalid_argument if t_outer is null
    explicit Decorator(MiddlewarePtr t_outer);

    auto operator()(MiddlewareItem t_inner) const -> std::shared_ptr<MiddlewareChain>;

private:
    MiddlewarePtr m_outer;
};

[[nodiscard]] auto middleware(MiddlewareItem t_outer) -> Decorator;

// The last prepended middleware runs first, the handler last. build() never touches the handler.
class ChainBuilder
{
public:
    explicit ChainBuilder(MiddlewareItem t_handler);

    [[nodiscard]] auto prepend(MiddlewareItem t_middleware) const -> ChainBuilder;

    [[nodiscard]] auto build() const -> std::shared_ptr<MiddlewareChain>;

private:
    ChainBuilder(MiddlewarePtr t_handler, std::vector<MiddlewarePtr> t_prepended)
        : m_handler(std::move(t_handler)), m_prepended(std::move(t_prepended))
    {}

    MiddlewarePtr m_handler;
    std::vector<MiddlewarePtr> m_prepended;
};
}  // namespace cascade::middleware
