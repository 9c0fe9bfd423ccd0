#pragma once

#include <optional>
#include <string_view>

namespace sdcp::protocol {

/// `Cmd` values understood by SDCP V3 mainboards.
enum class Command : int {
    Status = 0,
    Attributes = 1,
    StartPrint = 128,
    PausePrint = 129,
    StopPrint = 130,
    ContinuePrint = 131,
    StopFeedingMaterial = 132,
    SkipPreheating = 133,
    RenamePrinter = 192,
    ListFiles = 258,
    DeleteFiles = 259,
    TaskHistory = 320,
    TaskDetails = 321,
    VideoStream = 386,
    Timelapse = 387,
};

constexpr int toCode(Command command) { return static_cast<int>(command); }

/// Map a snake_case command name ("get_status", "pause_print") to its code.
std::optional<int> lookupCommand(std::string_view name);

/// Reverse of lookupCommand(); returns "unknown" for codes outside the table.
std::string_view commandName(int code);

} // namespace sdcp::protocol
