#pragma once

#include <any>
#include <map>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>

namespace cascade::context
{
class Context
{
public:
    using StateStore = std::unordered_map<std::type_index, std::any>;

    Context() = default;
    ~Context() = default;

    // Copies resources and the state store; the copy owns its own store.
    Context(const Context& t_other);
    auto operator=(const Context& t_other) -> Context&;

    Context(Context&&) noexcept = default;
    auto operator=(Context&&) noexcept -> Context& = default;

    template<typename T>
    auto set(const std::string& t_name, std::shared_ptr<T> t_resource) -> void
    {
        m_resources[t_name] = std::move(t_resource);
    }

    template<typename T>
    auto get(const std::string& t_name) const -> std::shared_ptr<T>
    {
        auto it = m_resources.find(t_name);
        if (it == m_resources.end()) {
            return nullptr;
        }

        return std::static_pointer_cast<T>(it->second);
    }

    [[nodiscard]] auto has(const std::string& t_name) const -> bool;

    // Creates the store when missing.
    auto states() -> StateStore&;

    [[nodiscard]] auto hasStates() const noexcept -> bool;

private:
    std::map<std::string, std::shared_ptr<void>> m_resources;
    std::unique_ptr<StateStore> m_states;
};

using ContextPtr = std::shared_ptr<Context>;
}  // namespace cascade::context
