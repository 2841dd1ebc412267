#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cascade/context/context.hpp"
#include "cascade/middleware/result.hpp"

namespace cascade::middleware
{
using context::Context;
using context::ContextPtr;

struct Arguments
{
    std::vector<std::any> positional;
    std::map<std::string, std::any, std::less<>> keyword;

    template<typename T>
    [[nodiscard]] auto positionalAs(std::size_t t_index) const -> std::optional<T>
    {
        if (t_index >= positional.size()) {
            return std::nullopt;
        }

        if (const auto* value = std::any_cast<T>(&positional[t_index])) {
            return *value;
        }

        return std::nullopt;
    }

    template<typename T>
    [[nodiscard]] auto keywordAs(std::string_view t_name) const -> std::optional<T>
    {
        auto it = keyword.find(t_name);
        if (it == keyword.end()) {
            return std::nullopt;
        }

        if (const auto* value = std::any_cast<T>(&it->second)) {
            return *value;
        }

        return std::nullopt;
    }

    [[nodiscard]] auto hasKeyword(std::string_view t_name) const -> bool
    {
        return keyword.find(t_name) != keyword.end();
    }
};

// The rest of the pipeline.
using Next = std::function<ResultSender(Arguments, ContextPtr)>;

// A plain function usable as a middleware.
using Function = std::function<ResultSender(Arguments, ContextPtr, Next)>;
}  // namespace cascade::middleware
