#pragma once

#include <cstddef>
#include <vector>

#include "cascade/core/logger.hpp"
#include "cascade/middleware/middleware.hpp"

namespace cascade::middleware
{
class MiddlewareCollection : public Middleware
{
public:
    using Collection = std::vector<MiddlewarePtr>;

    MiddlewareCollection();

    // @throws std::invalid_argument if t_middleware is null
    virtual auto add(MiddlewarePtr t_middleware) -> MiddlewarePtr;

    [[nodiscard]] auto collection() const noexcept -> const Collection&
    {
        return m_collection;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return m_collection.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return m_collection.empty();
    }

protected:
    core::Logger::LoggerPtr m_logger;

private:
    Collection m_collection;
};
}  // namespace cascade::middleware
