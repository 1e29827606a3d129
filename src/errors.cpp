#include "gitsync/errors.hpp"

#include <utility>

namespace gitsync {

std::string_view stage_name(Stage stage) {
  switch (stage) {
  case Stage::Discovery:
    return "discovery";
  case Stage::Collection:
    return "status";
  case Stage::Build:
    return "build";
  case Stage::Transport:
    return "push";
  case Stage::RemoteApply:
    return "remote apply";
  }
  return "unknown";
}

SyncError::SyncError(Stage stage, const std::string &what)
    : std::runtime_error(std::string(stage_name(stage)) + ": " + what), stage_(stage) {}

ProcessError::ProcessError(std::string command, int exit_status, std::string stderr_text)
    : std::runtime_error("command failed (exit " + std::to_string(exit_status) + "): " + command +
                         (stderr_text.empty() ? std::string{} : "\n" + stderr_text)),
      command_(std::move(command)), exit_status_(exit_status),
      stderr_text_(std::move(stderr_text)) {}

} // namespace gitsync
