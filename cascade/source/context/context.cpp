#include "cascade/context/context.hpp"

#include <memory>
#include <string>

namespace cascade::context
{
Context::Context(const Context& t_other)
    : m_resources(t_other.m_resources),
      m_states(t_other.m_states ? std::make_unique<StateStore>(*t_other.m_states) : nullptr)
{}

auto Context::operator=(const Context& t_other) -> Context&
{
    if (this != &t_other) {
        m_resources = t_other.m_resources;
        m_states = t_other.m_states ? std::make_unique<StateStore>(*t_other.m_states) : nullptr;
    }

    return *this;
}

auto Context::has(const std::string& t_name) const -> bool
{
    return m_resources.contains(t_name);
}

auto Context::states() -> StateStore&
{
    if (!m_states) {
        m_states = std::make_unique<StateStore>();
    }

    return *m_states;
}

auto Context::hasStates() const noexcept -> bool
{
    return m_states != nullptr;
}
}  // namespace cascade::context
