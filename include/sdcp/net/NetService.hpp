#pragma once
#include "sdcp/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace sdcp::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every printer handle and every discovery scan owns (or borrows) one of these,
 * so independent devices never share a loop or a lock.
 *
 * Lifetime notes:
 * - Destroy sockets and clients before the `NetService` so their handlers
 *   complete while the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    asio::io_context& context() { return *io_; }
    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

} // namespace sdcp::net
