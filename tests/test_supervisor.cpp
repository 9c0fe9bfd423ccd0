#include "sdcp/core/Error.hpp"
#include "sdcp/protocol/Commands.hpp"
#include "sdcp/session/SessionSupervisor.hpp"

#include "support/SimulatedNetwork.hpp"
#include "support/TestAssert.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace sdcp;
using namespace sdcp::session;
using namespace std::chrono_literals;
using sdcp::protocol::Json;
using sdcp::testing::SimulatedDevice;

namespace {

using Transition = std::pair<SessionState, SessionState>;

struct StateLog {
    std::mutex mutex;
    std::vector<Transition> transitions;

    SessionSupervisor::StateObserver observer() {
        return [this](SessionState from, SessionState to, error_code) {
            std::lock_guard lock(mutex);
            transitions.emplace_back(from, to);
        };
    }

    int count(SessionState to) {
        std::lock_guard lock(mutex);
        int n = 0;
        for (const auto& t : transitions) {
            if (t.second == to) ++n;
        }
        return n;
    }

    std::vector<Transition> snapshot() {
        std::lock_guard lock(mutex);
        return transitions;
    }
};

SessionOptions fastOptions() {
    SessionOptions options;
    options.deviceId = "client-1";
    options.config.connectTimeout = 200ms;
    options.config.handshakeTimeout = 200ms;
    options.config.commandTimeout = 300ms;
    options.config.keepaliveInterval = 0ms;
    options.config.idleTimeout = 0ms;
    options.config.readPollSlice = 10ms;
    return options;
}

BackoffConfig fastBackoff(std::size_t maxAttempts = 0) {
    BackoffConfig backoff;
    backoff.base = 10ms;
    backoff.cap = 40ms;
    backoff.maxAttempts = maxAttempts;
    return backoff;
}

protocol::Frame request(protocol::Command command) {
    return protocol::makeRequest(protocol::toCode(command), Json::object(), "", "", 0, 0);
}

} // namespace

static void testStateSequence() {
    SimulatedDevice device;
    std::atomic<int> readyCalls{0};
    SessionSupervisor::Hooks hooks;
    hooks.onReady = [&](ControlSession& session) {
        ASSERT_EQ(session.mainboardId(), std::string("MB-0001"), "ready session knows its mainboard");
        readyCalls.fetch_add(1);
    };

    StateLog log;
    SessionSupervisor supervisor(device.factory(), Endpoint{"printer.local"},
                                 std::make_shared<CommandCorrelator>(), fastOptions(),
                                 fastBackoff(), hooks);
    supervisor.addStateObserver(log.observer());
    ASSERT_TRUE(supervisor.state() == SessionState::Disconnected, "starts disconnected");
    ASSERT_TRUE(supervisor.readySession() == nullptr, "no session before start");

    supervisor.start();
    ASSERT_TRUE(supervisor.waitForState(SessionState::Ready, 1000ms), "reaches ready");
    ASSERT_TRUE(supervisor.readySession() != nullptr, "ready session available");
    ASSERT_TRUE(device.waitFor([&]{ return readyCalls.load() == 1; }, 500ms), "onReady ran once");

    const std::vector<Transition> wanted = {
        {SessionState::Disconnected, SessionState::Connecting},
        {SessionState::Connecting, SessionState::Handshaking},
        {SessionState::Handshaking, SessionState::Ready},
    };
    ASSERT_TRUE(log.snapshot() == wanted, "connecting, handshaking, ready");

    supervisor.close();
    ASSERT_TRUE(supervisor.state() == SessionState::Closed, "closed");
    ASSERT_TRUE(supervisor.readySession() == nullptr, "no session after close");
    ASSERT_EQ(supervisor.lastError(), make_error_code(errc::session_closed), "closed by request");
}

static void testReconnectCancelsPending() {
    SimulatedDevice device;
    device.setSilent(protocol::toCode(protocol::Command::StopPrint), true);
    std::atomic<int> readyCalls{0};
    SessionSupervisor::Hooks hooks;
    hooks.onReady = [&](ControlSession&) { readyCalls.fetch_add(1); };

    StateLog log;
    auto correlator = std::make_shared<CommandCorrelator>();
    SessionSupervisor supervisor(device.factory(), Endpoint{"printer.local"}, correlator,
                                 fastOptions(), fastBackoff(), hooks);
    supervisor.addStateObserver(log.observer());
    supervisor.start();
    ASSERT_TRUE(supervisor.waitForState(SessionState::Ready, 1000ms), "first ready");

    auto session = supervisor.readySession();
    if (!session) {
        ASSERT_TRUE(false, "session available");
        return;
    }
    auto ticket = session->sendAsync(request(protocol::Command::StopPrint), 5000ms);
    ASSERT_TRUE(ticket.has_value(), "command in flight");

    device.dropConnection();
    if (ticket) {
        const auto start = std::chrono::steady_clock::now();
        auto result = correlator->wait(*ticket);
        ASSERT_TRUE(!result.has_value(), "pending command failed");
        if (!result) {
            ASSERT_EQ(result.error(), make_error_code(errc::connection_lost), "connection lost");
        }
        ASSERT_TRUE(std::chrono::steady_clock::now() - start < 2000ms, "failed promptly");
    }

    ASSERT_TRUE(device.waitFor([&]{ return readyCalls.load() == 2; }, 2000ms), "ready again");
    ASSERT_EQ(device.connections(), 2, "reconnected once");
    ASSERT_EQ(log.count(SessionState::Reconnecting), 1, "one reconnect");
    ASSERT_TRUE(supervisor.readySession() != session, "fresh session");
    ASSERT_EQ(correlator->pendingCount(), static_cast<std::size_t>(0), "no stale commands");

    auto status = supervisor.readySession();
    if (status) {
        auto ack = status->send(request(protocol::Command::Status), 500ms);
        ASSERT_TRUE(ack.has_value(), "commands flow after reconnect");
    }
}

static void testRetriesExhausted() {
    SimulatedDevice device;
    device.setRefuseConnections(true);
    std::atomic<int> attempts{0};
    auto base = device.factory();
    TransportFactory counting = [&attempts, base]() {
        attempts.fetch_add(1);
        return base();
    };

    StateLog log;
    SessionSupervisor supervisor(counting, Endpoint{"printer.local"},
                                 std::make_shared<CommandCorrelator>(), fastOptions(),
                                 fastBackoff(3), {});
    supervisor.addStateObserver(log.observer());
    supervisor.start();

    ASSERT_TRUE(supervisor.waitForState(SessionState::Closed, 2000ms), "gives up");
    ASSERT_EQ(supervisor.lastError(), make_error_code(errc::retries_exhausted), "retries exhausted");
    ASSERT_TRUE(supervisor.lastError() == ErrorClass::SessionClosed, "session closed class");
    ASSERT_EQ(attempts.load(), 3, "three attempts");
    ASSERT_EQ(log.count(SessionState::Ready), 0, "never ready");
    ASSERT_EQ(log.count(SessionState::Closed), 1, "closed once");

    supervisor.close();
    ASSERT_EQ(log.count(SessionState::Closed), 1, "close after give-up is silent");
    ASSERT_EQ(supervisor.lastError(), make_error_code(errc::retries_exhausted), "error kept");
}

static void testCloseDuringBackoff() {
    SimulatedDevice device;
    device.setRefuseConnections(true);
    std::atomic<int> attempts{0};
    auto base = device.factory();
    TransportFactory counting = [&attempts, base]() {
        attempts.fetch_add(1);
        return base();
    };
    BackoffConfig slow;
    slow.base = 400ms;
    slow.cap = 400ms;
    slow.jitter = false;

    StateLog log;
    auto supervisor = std::make_unique<SessionSupervisor>(
        counting, Endpoint{"printer.local"}, std::make_shared<CommandCorrelator>(),
        fastOptions(), slow, SessionSupervisor::Hooks{});
    supervisor->addStateObserver(log.observer());
    supervisor->start();
    ASSERT_TRUE(supervisor->waitForState(SessionState::Reconnecting, 1000ms), "backing off");
    const int attemptsAtClose = attempts.load();

    const auto start = std::chrono::steady_clock::now();
    supervisor->close();
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < 200ms, "close interrupts the backoff");
    supervisor->close();
    ASSERT_TRUE(supervisor->waitForState(SessionState::Closed, 1000ms), "closed");

    // Well past the backoff delay: no reconnect may follow the close.
    std::this_thread::sleep_for(700ms);
    ASSERT_EQ(attempts.load(), attemptsAtClose, "no connect attempt after close");
    ASSERT_EQ(log.count(SessionState::Closed), 1, "closed exactly once");
    ASSERT_EQ(log.count(SessionState::Connecting), attemptsAtClose, "one Connecting per attempt");
    ASSERT_TRUE(supervisor->state() == SessionState::Closed, "stays closed");

    supervisor.reset();
    ASSERT_EQ(log.count(SessionState::Closed), 1, "destruction after close adds nothing");
}

static void testCloseCancelsPending() {
    SimulatedDevice device;
    device.setSilent(protocol::toCode(protocol::Command::PausePrint), true);
    auto correlator = std::make_shared<CommandCorrelator>();
    StateLog log;
    SessionSupervisor supervisor(device.factory(), Endpoint{"printer.local"}, correlator,
                                 fastOptions(), fastBackoff(), {});
    supervisor.addStateObserver(log.observer());
    supervisor.start();
    ASSERT_TRUE(supervisor.waitForState(SessionState::Ready, 1000ms), "ready");

    auto session = supervisor.readySession();
    if (!session) {
        ASSERT_TRUE(false, "session available");
        return;
    }
    auto ticket = session->sendAsync(request(protocol::Command::PausePrint), 5000ms);
    supervisor.close();
    supervisor.close();
    if (ticket) {
        auto result = correlator->wait(*ticket);
        ASSERT_TRUE(!result && result.error() == make_error_code(errc::session_closed), "cancelled by close");
    }
    ASSERT_EQ(log.count(SessionState::Closed), 1, "closed observed once");
    ASSERT_EQ(log.count(SessionState::Reconnecting), 0, "close is not a loss");

    supervisor.start();
    ASSERT_TRUE(supervisor.state() == SessionState::Closed, "closed is terminal");
}

static void testCloseFromObserver() {
    SimulatedDevice device;
    SessionSupervisor supervisor(device.factory(), Endpoint{"printer.local"},
                                 std::make_shared<CommandCorrelator>(), fastOptions(),
                                 fastBackoff(), {});
    supervisor.addStateObserver([&supervisor](SessionState, SessionState to, error_code) {
        if (to == SessionState::Ready) {
            supervisor.close();
        }
    });
    supervisor.start();
    ASSERT_TRUE(supervisor.waitForState(SessionState::Closed, 1000ms), "closed from observer");
}

static void testObserverRemoval() {
    SimulatedDevice device;
    SessionSupervisor supervisor(device.factory(), Endpoint{"printer.local"},
                                 std::make_shared<CommandCorrelator>(), fastOptions(),
                                 fastBackoff(), {});
    StateLog log;
    const auto id = supervisor.addStateObserver(log.observer());
    ASSERT_TRUE(supervisor.removeStateObserver(id), "observer removed");
    ASSERT_TRUE(!supervisor.removeStateObserver(id), "second removal fails");
    supervisor.start();
    ASSERT_TRUE(supervisor.waitForState(SessionState::Ready, 1000ms), "ready");
    ASSERT_EQ(log.snapshot().size(), static_cast<std::size_t>(0), "removed observer not called");
}

int main() {
    testStateSequence();
    testReconnectCancelsPending();
    testRetriesExhausted();
    testCloseDuringBackoff();
    testCloseCancelsPending();
    testCloseFromObserver();
    testObserverRemoval();
    return reportResult("SessionSupervisor");
}
