#include "sdcp/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace sdcp::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<bool> infoEnabled{true};

LogHandler currentHandler(const LogHandler& slot) {
    std::lock_guard lock(sinkMutex);
    return slot;
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
    infoEnabled.store(true, std::memory_order_relaxed);
}

void setInfoLoggingEnabled(bool enabled) {
    infoEnabled.store(enabled, std::memory_order_relaxed);
}

bool infoLoggingEnabled() {
    return infoEnabled.load(std::memory_order_relaxed);
}

void logInfo(std::string_view message) {
    if (!infoLoggingEnabled()) {
        return;
    }
    // Copy the handler out so a slow sink never holds the lock.
    if (auto handler = currentHandler(infoHandler)) {
        handler(message);
    }
}

void logError(std::string_view message) {
    if (auto handler = currentHandler(errorHandler)) {
        handler(message);
    }
}

} // namespace sdcp::log
