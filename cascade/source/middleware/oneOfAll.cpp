#include "cascade/middleware/oneOfAll.hpp"

#include <cstddef>
#include <memory>

#include "cascade/common/resultSender.hpp"

namespace cascade::middleware
{
namespace
{
using Members = std::shared_ptr<const MiddlewareCollection::Collection>;

auto tryFrom(const Members& t_members, std::size_t t_index, const Next& t_next, const Arguments& t_args,
             const ContextPtr& t_ctx) -> ResultSender
{
    if (t_index == t_members->size()) {
        return ready(MiddlewareResult::ignore);
    }

    return ResultSender{
        (*t_members)[t_index]->run(t_args, t_ctx, t_next)
            | stdexec::let_value([t_members, t_index, t_next, t_args, t_ctx](Result& t_result) -> ResultSender {
                  if (isSuccessfulResult(t_result)) {
                      return ready(std::move(t_result));
                  }

                  return tryFrom(t_members, t_index + 1, t_next, t_args, t_ctx);
              })
    };
}
}  // namespace

auto OneOfAll::run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender
{
    auto members = std::make_shared<const Collection>(collection());

    return common::deferResult<Result>(
        [members = std::move(members), next = std::move(t_next), args = std::move(t_args),
         ctx = std::move(t_ctx)]() { return tryFrom(members, 0, next, args, ctx); });
}
}  // namespace cascade::middleware
