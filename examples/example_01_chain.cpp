#include <cascade/cascade.hpp>

#include <stdexec/execution.hpp>

#include <memory>
#include <string>

namespace
{
using namespace cascade::middleware;

struct Audit : MiddlewareState::ContextState
{
    int handled{0};
};

auto onlyCommands() -> Function
{
    return [](Arguments t_args, ContextPtr t_ctx, Next t_next) -> ResultSender {
        const auto text = t_args.positionalAs<std::string>(0).value_or("");
        if (!text.starts_with("!")) {
            return ready(MiddlewareResult::ignore);
        }

        return t_next(std::move(t_args), std::move(t_ctx));
    };
}

auto greet(Arguments t_args, ContextPtr t_ctx, Next) -> ResultSender
{
    auto audit = MiddlewareState::getState<Audit>(*t_ctx);
    ++audit->handled;

    const auto author = t_args.keywordAs<std::string>("author").value_or("stranger");
    return ready(Result{"Hello, " + author + "!"});
}
}  // namespace

int main()
{
    cascade::core::Logger::init();
    auto logger = cascade::core::Logger::createLogger("EXAMPLE");

    auto chain = ChainBuilder{asMiddleware(greet, "greet")}
                     .prepend(onlyCommands())
                     .prepend(MiddlewareState::perRun<Audit>())
                     .build();

    Next unhandled = [](Arguments, ContextPtr) -> ResultSender { return ready(MiddlewareResult::ignore); };

    for (const std::string text: {"!hello", "just chatting"}) {
        Arguments args;
        args.positional.emplace_back(text);
        args.keyword.insert_or_assign(std::string{"author"}, std::string{"alice"});

        auto ctx = std::make_shared<cascade::context::Context>();
        auto [result] = stdexec::sync_wait((*chain)(std::move(args), ctx, unhandled)).value();

        if (const auto* reply = std::any_cast<std::string>(&result)) {
            CASCADE_LOG_INFO(logger, "'{}' -> {} (handled {})", text, *reply,
                             MiddlewareState::getState<Audit>(*ctx)->handled);
        } else {
            CASCADE_LOG_INFO(logger, "'{}' ignored: {}", text, !isSuccessfulResult(result));
        }
    }

    cascade::core::Logger::shutdown();

    return 0;
}
