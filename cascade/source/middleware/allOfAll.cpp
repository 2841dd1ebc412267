#include "cascade/middleware/allOfAll.hpp"

#include <cstddef>
#include <memory>

#include "cascade/common/resultSender.hpp"

namespace cascade::middleware
{
namespace
{
using Members = std::shared_ptr<const MiddlewareCollection::Collection>;

auto collectFrom(const Members& t_members, std::size_t t_index, const Next& t_next, const Arguments& t_args,
                 const ContextPtr& t_ctx, Results t_results) -> ResultSender
{
    if (t_index == t_members->size()) {
        return ready(Result{std::move(t_results)});
    }

    return ResultSender{
        (*t_members)[t_index]->run(t_args, t_ctx, t_next)
            | stdexec::let_value([t_members, t_index, t_next, t_args, t_ctx,
                                  results = std::move(t_results)](Result& t_result) mutable -> ResultSender {
                  results.push_back(std::move(t_result));
                  return collectFrom(t_members, t_index + 1, t_next, t_args, t_ctx, std::move(results));
              })
    };
}
}  // namespace

auto AllOfAll::run(Arguments t_args, ContextPtr t_ctx, Next t_next) const -> ResultSender
{
    auto members = std::make_shared<const Collection>(collection());

    return common::deferResult<Result>(
        [members = std::move(members), next = std::move(t_next), args = std::move(t_args),
         ctx = std::move(t_ctx)]() {
            Results results;
            results.reserve(members->size());
            return collectFrom(members, 0, next, args, ctx, std::move(results));
        });
}
}  // namespace cascade::middleware
