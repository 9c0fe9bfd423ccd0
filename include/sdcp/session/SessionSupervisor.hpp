#pragma once

#include "sdcp/session/Backoff.hpp"
#include "sdcp/session/CommandCorrelator.hpp"
#include "sdcp/session/ControlSession.hpp"
#include "sdcp/session/MessageTransport.hpp"
#include "sdcp/session/SessionConfig.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace sdcp::session {

/**
 * @brief Keeps one logical connection alive across transport failures.
 *
 * State machine:
 *   Disconnected -> Connecting -> Handshaking -> Ready
 *   Ready -> Reconnecting -> Connecting ...   (session loss)
 *   Connecting/Handshaking -> Reconnecting    (failed attempt)
 *   any -> Closed                             (close() or retries exhausted)
 *
 * A worker thread runs the attempts and sleeps the backoff on a condition
 * variable, so `close()` interrupts it immediately. On loss every pending
 * command is cancelled with `connection_lost`; on close with `session_closed`.
 */
class SessionSupervisor {
public:
    using StateObserver = std::function<void(SessionState from, SessionState to, error_code error)>;

    struct Hooks {
        /// Runs on the worker thread each time the state becomes Ready.
        std::function<void(ControlSession&)> onReady;
        /// Unsolicited frames of whichever session is current.
        ControlSession::FrameHandler onFrame;
    };

    SessionSupervisor(TransportFactory factory,
                      Endpoint endpoint,
                      std::shared_ptr<CommandCorrelator> correlator,
                      SessionOptions options,
                      BackoffConfig backoff,
                      Hooks hooks);
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    /// Start the worker. Calling it twice, or after close(), does nothing.
    void start();

    /// Terminal. Safe from any thread, including observers and frame handlers.
    void close();

    SessionState state() const;
    error_code lastError() const;

    /// Wait until the state equals @p target. Returns false on timeout, or
    /// early once the supervisor is Closed and @p target is not.
    bool waitForState(SessionState target, std::chrono::milliseconds timeout) const;

    /// Current session while Ready, otherwise null.
    std::shared_ptr<ControlSession> readySession() const;

    std::size_t addStateObserver(StateObserver observer);
    bool removeStateObserver(std::size_t id);

private:
    void run();
    bool attempt(std::uint64_t generation);
    void handleLoss(std::uint64_t generation, error_code ec);
    bool transition(SessionState to, error_code error = {});
    bool transitionFrom(SessionState from, SessionState to, error_code error = {});
    void giveUp(error_code error);
    void notify(SessionState from, SessionState to, error_code error);

    TransportFactory factory_;
    Endpoint endpoint_;
    std::shared_ptr<CommandCorrelator> correlator_;
    SessionOptions options_;
    Backoff backoff_;
    Hooks hooks_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    SessionState state_ = SessionState::Disconnected;
    error_code lastError_;
    bool started_ = false;
    bool closing_ = false;
    bool sessionLost_ = false;
    std::uint64_t generation_ = 0;
    std::shared_ptr<MessageTransport> connecting_;
    std::shared_ptr<ControlSession> current_;

    std::recursive_mutex notifyMutex_;
    std::mutex observerMutex_;
    std::map<std::size_t, StateObserver> observers_;
    std::size_t nextObserverId_ = 1;

    std::thread worker_;
};

} // namespace sdcp::session
