#pragma once
#include "sdcp/net/NetConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace sdcp::net {

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - If the timer fires first, `cancel()` is invoked and the result becomes
 *   `timed_out()`.
 * - The call returns only after the operation's own completion handler has
 *   run, so buffers owned by the caller are never touched after return.
 *
 * Requirements:
 * - The io_context behind `ex` must be running on another thread while we
 *   block, otherwise the wait never completes.
 * - `start_async` receives a completion functor `(const error_code&, ...)`
 *   and must pass it to exactly one async initiation.
 * - `cancel` must cancel the object that launched the operation.
 */
template<typename StartAsync, typename Cancel>
error_code with_deadline(
    asio::any_io_executor ex,
    milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool opDone = false;
        bool timedOut = false;
        error_code ec;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const boost::system::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            st->ec = op_ec;
            st->opDone = true;
        }
        timer->cancel();
        st->cv.notify_one();
    };

    // Initiate on the executor so the operation never races other work
    // queued on the same strand.
    asio::dispatch(ex, [start_async, op_handler]() mutable {
        start_async(op_handler);
    });

    timer->expires_after(timeout);
    timer->async_wait([st, cancel](const boost::system::error_code& tec) mutable {
        if (tec == asio::error::operation_aborted) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->opDone) {
                return;
            }
            st->timedOut = true;
        }
        cancel();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->opDone; });
    if (st->timedOut) {
        return timed_out();
    }
    return st->ec;
}

} // namespace sdcp::net
