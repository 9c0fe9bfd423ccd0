#include "sdcp/protocol/Commands.hpp"

#include <array>
#include <utility>

namespace sdcp::protocol {

namespace {

constexpr std::array<std::pair<std::string_view, Command>, 15> COMMAND_TABLE{{
    {"get_status", Command::Status},
    {"get_attributes", Command::Attributes},
    {"start_print", Command::StartPrint},
    {"pause_print", Command::PausePrint},
    {"stop_print", Command::StopPrint},
    {"continue_print", Command::ContinuePrint},
    {"stop_feeding_material", Command::StopFeedingMaterial},
    {"skip_preheating", Command::SkipPreheating},
    {"rename_printer", Command::RenamePrinter},
    {"list_files", Command::ListFiles},
    {"delete_files", Command::DeleteFiles},
    {"task_history", Command::TaskHistory},
    {"task_details", Command::TaskDetails},
    {"video_stream", Command::VideoStream},
    {"timelapse", Command::Timelapse},
}};

} // namespace

std::optional<int> lookupCommand(std::string_view name) {
    for (const auto& [entryName, command] : COMMAND_TABLE) {
        if (entryName == name) {
            return toCode(command);
        }
    }
    return std::nullopt;
}

std::string_view commandName(int code) {
    for (const auto& [entryName, command] : COMMAND_TABLE) {
        if (toCode(command) == code) {
            return entryName;
        }
    }
    return "unknown";
}

} // namespace sdcp::protocol
