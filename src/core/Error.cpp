#include "sdcp/core/Error.hpp"

namespace sdcp {

namespace {

class SdcpCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "sdcp"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::decode_error:         return "malformed frame";
            case errc::handshake_timeout:    return "handshake timed out";
            case errc::protocol_mismatch:    return "protocol version mismatch";
            case errc::command_timeout:      return "command timed out";
            case errc::command_rejected:     return "command rejected by device";
            case errc::command_unsupported:  return "command not supported by device";
            case errc::connection_lost:      return "connection lost";
            case errc::session_closed:       return "session closed";
            case errc::not_ready:            return "session not ready";
            case errc::duplicate_request_id: return "request id already outstanding";
            case errc::cancelled:            return "command cancelled";
            case errc::retries_exhausted:    return "reconnect attempts exhausted";
            case errc::liveness_timeout:     return "no traffic within idle window";
        }
        return "unknown sdcp error";
    }

    std::error_condition default_error_condition(int value) const noexcept override {
        switch (static_cast<errc>(value)) {
            case errc::decode_error:
                return ErrorClass::Decode;
            case errc::handshake_timeout:
            case errc::protocol_mismatch:
                return ErrorClass::Protocol;
            case errc::command_timeout:
                return ErrorClass::CommandTimeout;
            case errc::command_rejected:
            case errc::command_unsupported:
                return ErrorClass::CommandRejected;
            case errc::session_closed:
            case errc::retries_exhausted:
                return ErrorClass::SessionClosed;
            case errc::connection_lost:
            case errc::liveness_timeout:
                return ErrorClass::Transport;
            case errc::not_ready:
            case errc::duplicate_request_id:
            case errc::cancelled:
                break;
        }
        return std::error_condition(value, *this);
    }
};

class ErrorClassCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "sdcp-class"; }

    std::string message(int value) const override {
        switch (static_cast<ErrorClass>(value)) {
            case ErrorClass::Transport:       return "transport";
            case ErrorClass::Decode:          return "decode";
            case ErrorClass::Protocol:        return "protocol";
            case ErrorClass::CommandTimeout:  return "command timeout";
            case ErrorClass::CommandRejected: return "command rejected";
            case ErrorClass::SessionClosed:   return "session closed";
        }
        return "unclassified";
    }

    // Anything raised by the OS or Asio (system/generic/netdb/misc categories)
    // is a transport failure.
    bool equivalent(const std::error_code& code, int condition) const noexcept override {
        if (code.category() == sdcp_category()) {
            return code.category().default_error_condition(code.value())
                == std::error_condition(condition, *this);
        }
        return condition == static_cast<int>(ErrorClass::Transport) && code;
    }
};

} // namespace

const std::error_category& sdcp_category() noexcept {
    static const SdcpCategory category;
    return category;
}

const std::error_category& error_class_category() noexcept {
    static const ErrorClassCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), sdcp_category()};
}

std::error_condition make_error_condition(ErrorClass e) noexcept {
    return {static_cast<int>(e), error_class_category()};
}

std::string describeErrorClass(const std::error_code& ec) {
    if (!ec) {
        return "none";
    }
    for (auto cls : {ErrorClass::Transport, ErrorClass::Decode, ErrorClass::Protocol,
                     ErrorClass::CommandTimeout, ErrorClass::CommandRejected,
                     ErrorClass::SessionClosed}) {
        if (ec == cls) {
            return error_class_category().message(static_cast<int>(cls));
        }
    }
    return "other";
}

} // namespace sdcp
