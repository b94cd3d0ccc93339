#pragma once

#include <vector>
#include <utility>
#include <cstddef>
#include <exception>

#include <boost/asio.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

namespace gather
{
  namespace asio = boost::asio;

  // Outcome of a group of concurrently executed awaitables.
  //
  template <typename R>
  struct group_result
  {
    // Indices into the submitted sequence in the order the awaitables
    // completed.
    //
    std::vector<std::size_t> order;

    // Per awaitable, in submission order. The value is default-constructed
    // if the corresponding awaitable threw.
    //
    std::vector<std::exception_ptr> errors;
    std::vector<R> values;

    std::size_t
    failed () const noexcept
    {
      std::size_t n (0);
      for (const auto& e: errors)
        if (e)
          ++n;
      return n;
    }

    // Rethrow the first failure in completion order, if any.
    //
    void
    rethrow () const
    {
      for (std::size_t i: order)
        if (errors[i])
          std::rethrow_exception (errors[i]);
    }
  };

  // Run the awaitables concurrently on the current executor and wait for all
  // of them to finish. Cancellation of the caller is forwarded to every
  // member of the group.
  //
  template <typename R>
  asio::awaitable<group_result<R>>
  when_all (std::vector<asio::awaitable<R>> tasks)
  {
    group_result<R> r;

    if (tasks.empty ())
      co_return r;

    auto ex (co_await asio::this_coro::executor);

    using op_type = decltype (
      asio::co_spawn (ex, std::declval<asio::awaitable<R>> (), asio::deferred));

    std::vector<op_type> ops;
    ops.reserve (tasks.size ());

    for (auto& t: tasks)
      ops.push_back (asio::co_spawn (ex, std::move (t), asio::deferred));

    auto [order, errors, values] (
      co_await asio::experimental::make_parallel_group (std::move (ops))
        .async_wait (asio::experimental::wait_for_all (),
                     asio::use_awaitable));

    r.order = std::move (order);
    r.errors = std::move (errors);
    r.values = std::move (values);

    co_return r;
  }
}
