#include "cascade/middleware/middlewareCollection.hpp"

#include <stdexcept>

#include "cascade/core/logger.hpp"

namespace cascade::middleware
{
MiddlewareCollection::MiddlewareCollection() : m_logger(core::Logger::createLogger("MIDDLEWARE")) {}

auto MiddlewareCollection::add(MiddlewarePtr t_middleware) -> MiddlewarePtr
{
    if (!t_middleware) {
        throw std::invalid_argument{"Not a middleware"};
    }

    m_collection.push_back(t_middleware);

    CASCADE_LOG_TRACE(m_logger, "Added middleware '{}' at position {}", t_middleware->name(), m_collection.size() - 1);

    return t_middleware;
}
}  // namespace cascade::middleware
