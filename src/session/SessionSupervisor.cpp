#include "sdcp/session/SessionSupervisor.hpp"

#include "sdcp/core/Error.hpp"
#include "sdcp/log/Log.hpp"

#include <vector>

namespace sdcp::session {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting:   return "connecting";
        case SessionState::Handshaking:  return "handshaking";
        case SessionState::Ready:        return "ready";
        case SessionState::Reconnecting: return "reconnecting";
        case SessionState::Closed:       return "closed";
    }
    return "unknown";
}

SessionSupervisor::SessionSupervisor(TransportFactory factory,
                                     Endpoint endpoint,
                                     std::shared_ptr<CommandCorrelator> correlator,
                                     SessionOptions options,
                                     BackoffConfig backoff,
                                     Hooks hooks)
: factory_(std::move(factory))
, endpoint_(std::move(endpoint))
, correlator_(std::move(correlator))
, options_(std::move(options))
, backoff_(backoff)
, hooks_(std::move(hooks))
{}

SessionSupervisor::~SessionSupervisor() {
    close();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void SessionSupervisor::start() {
    std::lock_guard lock(mutex_);
    if (started_ || closing_) {
        return;
    }
    started_ = true;
    worker_ = std::thread([this]{ run(); });
}

void SessionSupervisor::close() {
    std::shared_ptr<MessageTransport> connecting;
    std::shared_ptr<ControlSession> session;
    {
        std::lock_guard lock(mutex_);
        if (closing_) {
            return;
        }
        closing_ = true;
        connecting = connecting_;
        session = current_;
    }
    cv_.notify_all();

    // Nothing here joins a thread: close() may run inside a frame handler or
    // state observer. The worker releases the session on its way out.
    if (connecting) {
        connecting->close();
    }
    if (session) {
        session->abort();
    }
    correlator_->cancelAll(make_error_code(errc::session_closed));
    transition(SessionState::Closed, make_error_code(errc::session_closed));
}

SessionState SessionSupervisor::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

error_code SessionSupervisor::lastError() const {
    std::lock_guard lock(mutex_);
    return lastError_;
}

bool SessionSupervisor::waitForState(SessionState target, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&]{
        return state_ == target || state_ == SessionState::Closed;
    });
    return state_ == target;
}

std::shared_ptr<ControlSession> SessionSupervisor::readySession() const {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Ready) {
        return nullptr;
    }
    return current_;
}

std::size_t SessionSupervisor::addStateObserver(StateObserver observer) {
    std::lock_guard lock(observerMutex_);
    const auto id = nextObserverId_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

bool SessionSupervisor::removeStateObserver(std::size_t id) {
    std::lock_guard lock(observerMutex_);
    return observers_.erase(id) > 0;
}

void SessionSupervisor::run() {
    std::size_t failures = 0;
    while (true) {
        std::uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            if (closing_) {
                break;
            }
            generation = ++generation_;
            sessionLost_ = false;
        }

        std::size_t backoffAttempt = 0;
        if (attempt(generation)) {
            failures = 0;
            std::shared_ptr<ControlSession> session;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [&]{ return closing_ || sessionLost_; });
                if (closing_) {
                    break;
                }
                session = std::move(current_);
            }
            transitionFrom(SessionState::Ready, SessionState::Reconnecting, lastError());
            session->close();
        } else {
            {
                std::lock_guard lock(mutex_);
                if (closing_) {
                    break;
                }
            }
            ++failures;
            const auto& limits = backoff_.config();
            if (limits.maxAttempts != 0 && failures >= limits.maxAttempts) {
                logError("[Supervisor] giving up on ", endpoint_.host, " after ", failures,
                         " attempt(s)\n");
                giveUp(make_error_code(errc::retries_exhausted));
                break;
            }
            transition(SessionState::Reconnecting, lastError());
            backoffAttempt = failures;
        }

        const auto delay = backoff_.delay(backoffAttempt);
        logInfo("[Supervisor] retrying ", endpoint_.host, " in ", delay.count(), " ms\n");
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, delay, [&]{ return closing_; });
    }

    std::shared_ptr<ControlSession> session;
    {
        std::lock_guard lock(mutex_);
        session = std::move(current_);
    }
    if (session) {
        session->close();
    }
}

bool SessionSupervisor::attempt(std::uint64_t generation) {
    if (!transition(SessionState::Connecting)) {
        return false;
    }

    std::shared_ptr<MessageTransport> transport(factory_());
    if (!transport) {
        std::lock_guard lock(mutex_);
        lastError_ = make_error_code(errc::session_closed);
        return false;
    }
    {
        std::lock_guard lock(mutex_);
        if (closing_) {
            return false;
        }
        connecting_ = transport;
    }

    ControlSession::Handlers handlers;
    handlers.onFrame = hooks_.onFrame;
    handlers.onLoss = [this, generation](error_code ec){ handleLoss(generation, ec); };
    handlers.onTransportUp = [this]{
        transitionFrom(SessionState::Connecting, SessionState::Handshaking);
    };

    auto session = ControlSession::connect(transport, endpoint_, correlator_, options_,
                                           std::move(handlers));
    {
        std::unique_lock lock(mutex_);
        connecting_.reset();
        if (!session) {
            lastError_ = session.error();
            lock.unlock();
            logError("[Supervisor] attempt on ", endpoint_.host, " failed: ",
                     session.error().message(), "\n");
            return false;
        }
        if (closing_ || sessionLost_) {
            lock.unlock();
            (*session)->close();
            return false;
        }
        current_ = *session;
    }

    if (options_.mainboardId.empty()) {
        options_.mainboardId = (*session)->mainboardId();
    }
    if (!transition(SessionState::Ready)) {
        return false;
    }
    if (hooks_.onReady) {
        hooks_.onReady(**session);
    }
    return true;
}

void SessionSupervisor::handleLoss(std::uint64_t generation, error_code ec) {
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_ || closing_) {
            return;
        }
        sessionLost_ = true;
        lastError_ = ec;
    }
    cv_.notify_all();
    correlator_->cancelAll(make_error_code(errc::connection_lost));
    transitionFrom(SessionState::Ready, SessionState::Reconnecting, ec);
}

void SessionSupervisor::giveUp(error_code error) {
    {
        std::lock_guard lock(mutex_);
        closing_ = true;
        lastError_ = error;
    }
    cv_.notify_all();
    correlator_->cancelAll(error);
    transition(SessionState::Closed, error);
}

bool SessionSupervisor::transition(SessionState to, error_code error) {
    std::lock_guard<std::recursive_mutex> serial(notifyMutex_);
    SessionState from;
    {
        std::lock_guard lock(mutex_);
        from = state_;
        if (from == SessionState::Closed || from == to) {
            return false;
        }
        state_ = to;
        if (error) {
            lastError_ = error;
        }
    }
    cv_.notify_all();
    notify(from, to, error);
    return true;
}

bool SessionSupervisor::transitionFrom(SessionState from, SessionState to, error_code error) {
    std::lock_guard<std::recursive_mutex> serial(notifyMutex_);
    {
        std::lock_guard lock(mutex_);
        if (state_ != from) {
            return false;
        }
        state_ = to;
        if (error) {
            lastError_ = error;
        }
    }
    cv_.notify_all();
    notify(from, to, error);
    return true;
}

void SessionSupervisor::notify(SessionState from, SessionState to, error_code error) {
    if (error) {
        logInfo("[Supervisor] ", endpoint_.host, ": ", toString(from), " -> ", toString(to),
                " (", error.message(), ")\n");
    } else {
        logInfo("[Supervisor] ", endpoint_.host, ": ", toString(from), " -> ", toString(to), "\n");
    }

    std::vector<StateObserver> observers;
    {
        std::lock_guard lock(observerMutex_);
        observers.reserve(observers_.size());
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        observer(from, to, error);
    }
}

} // namespace sdcp::session
