#pragma once

#include "lockstep/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace lockstep {

template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);
namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

// Suspends the calling coroutine on its own executor. A cancelled wait is
// reported as Error::Cancelled.
inline auto async_sleep(std::chrono::steady_clock::duration d)
    -> task<Result<void>> {
  boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};
  timer.expires_after(d);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  if (ec == boost::asio::error::operation_aborted) {
    co_return fail(Error::Cancelled);
  }
  co_return as_result(std::tuple{ec});
}

// Runs a blocking callable on `pool` and resumes the awaiting coroutine on
// its original executor with the callable's return value.
template <typename Fn>
  requires(!std::is_void_v<std::invoke_result_t<Fn &>>)
auto offload(boost::asio::thread_pool &pool, Fn fn)
    -> task<std::invoke_result_t<Fn &>> {
  using R = std::invoke_result_t<Fn &>;
  auto caller = co_await boost::asio::this_coro::executor;

  co_return co_await boost::asio::async_initiate<
      const boost::asio::use_awaitable_t<>, void(R)>(
      [&pool, caller, fn = std::move(fn)](auto handler) mutable {
        boost::asio::post(
            pool, [caller, fn = std::move(fn),
                   handler = std::move(handler)]() mutable {
              auto value = fn();
              boost::asio::dispatch(
                  caller, [handler = std::move(handler),
                           value = std::move(value)]() mutable {
                    std::move(handler)(std::move(value));
                  });
            });
      },
      use_awaitable);
}

} // namespace lockstep
