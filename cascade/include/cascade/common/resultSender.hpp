#pragma once

#include <exception>
#include <utility>

#include <exec/any_sender_of.hpp>
#include <stdexec/execution.hpp>

namespace cascade::common
{
template<class... Sigs>
using any_sender_of = exec::any_receiver_ref<stdexec::completion_signatures<Sigs...>>::template any_sender<>;

template<typename T>
using ResultSender = any_sender_of<
    stdexec::set_value_t(T),
    stdexec::set_error_t(std::exception_ptr),
    stdexec::set_stopped_t()
>;

// Sender that completes inline with t_value.
template<typename T>
auto justResult(T t_value) -> ResultSender<T>
{
    return ResultSender<T>{stdexec::just(std::move(t_value))};
}

// Defers t_factory until the returned sender is started.
template<typename T, typename Factory>
auto deferResult(Factory&& t_factory) -> ResultSender<T>
{
    return ResultSender<T>{
        stdexec::just() | stdexec::let_value(std::forward<Factory>(t_factory))
    };
}
}  // namespace cascade::common
