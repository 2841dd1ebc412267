#pragma once

#include <memory>
#include <string>

#include "cascade/middleware/arguments.hpp"
#include "cascade/middleware/result.hpp"

namespace cascade::middleware
{
class Middleware
{
public:
    Middleware() = default;
    virtual ~Middleware() = default;

    Middleware(const Middleware&) = delete;
    Middleware(Middleware&&) = delete;
    auto operator=(const Middleware&) -> Middleware& = delete;
    auto operator=(Middleware&&) -> Middleware& = delete;

    virtual auto run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender = 0;

    auto operator()(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender
    {
        return run(std::move(t_args), std::move(t_ctx), std::move(t_next));
    }

    // Null unless converted from a function, or a chain whose first member was.
    [[nodiscard]] auto fn() const noexcept -> const std::shared_ptr<const Function>&
    {
        return m_fn;
    }

    [[nodiscard]] auto name() const noexcept -> const std::string&
    {
        return m_name;
    }

    [[nodiscard]] static auto isSuccessfulResult(const Result& t_value) noexcept -> bool
    {
        return middleware::isSuccessfulResult(t_value);
    }

protected:
    auto adoptSource(std::shared_ptr<const Function> t_fn, std::string t_name) -> void
    {
        m_fn = std::move(t_fn);
        m_name = std::move(t_name);
    }

private:
    std::shared_ptr<const Function> m_fn;
    std::string m_name;
};

using MiddlewarePtr = std::shared_ptr<Middleware>;
}  // namespace cascade::middleware
