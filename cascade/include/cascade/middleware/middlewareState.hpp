#pragma once

#include <any>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

#include "cascade/middleware/middleware.hpp"

namespace cascade::middleware
{
// States are stored under their type T and, with a key, passed on as std::shared_ptr<T>.
class MiddlewareState : public Middleware
{
public:
    struct ContextState
    {
        virtual ~ContextState() = default;
    };

    template<typename T>
    explicit MiddlewareState(std::shared_ptr<T> t_state, std::optional<std::string> t_key = std::nullopt)
        : m_type(typeid(T)), m_key(std::move(t_key))
    {
        if (!t_state) {
            throw std::invalid_argument{"State is null"};
        }

        m_provider = [state = std::move(t_state)]() -> std::any { return state; };
    }

    template<std::derived_from<ContextState> T>
        requires std::is_default_constructible_v<T>
    [[nodiscard]] static auto perRun(std::optional<std::string> t_key = std::nullopt)
        -> std::shared_ptr<MiddlewareState>
    {
        return std::make_shared<MiddlewareState>(
            PerRunTag{}, typeid(T), []() -> std::any { return std::make_shared<T>(); }, std::move(t_key));
    }

    auto run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender override;

    [[nodiscard]] auto key() const noexcept -> const std::optional<std::string>&
    {
        return m_key;
    }

    [[nodiscard]] auto isPerRun() const noexcept -> bool
    {
        return m_perRun;
    }

    template<typename T>
    [[nodiscard]] static auto getState(Context& t_ctx) -> std::shared_ptr<T>
    {
        const auto& states = t_ctx.states();
        auto it = states.find(typeid(T));
        if (it == states.end()) {
            return nullptr;
        }

        if (const auto* state = std::any_cast<std::shared_ptr<T>>(&it->second)) {
            return *state;
        }

        return nullptr;
    }

    template<typename T>
    static auto setState(Context& t_ctx, std::shared_ptr<T> t_state) -> void
    {
        setState(t_ctx, typeid(T), std::any{std::move(t_state)});
    }

private:
    struct PerRunTag
    {};

    using Provider = std::function<std::any()>;

public:
    // Reachable only through perRun().
    MiddlewareState(PerRunTag t_tag, std::type_index t_type, Provider t_provider, std::optional<std::string> t_key);

private:
    static auto setState(Context& t_ctx, std::type_index t_type, std::any t_state) -> void;

    std::type_index m_type;
    Provider m_provider;
    std::optional<std::string> m_key;
    bool m_perRun{false};
};
}  // namespace cascade::middleware
