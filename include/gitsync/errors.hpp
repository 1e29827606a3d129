#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitsync {

// Phase of a sync run in which a failure happened.
enum class Stage : std::uint8_t { Discovery, Collection, Build, Transport, RemoteApply };

std::string_view stage_name(Stage stage);

class SyncError : public std::runtime_error {
public:
  SyncError(Stage stage, const std::string &what);
  [[nodiscard]] Stage stage() const { return stage_; }

private:
  Stage stage_;
};

// A child process exited unsuccessfully.
class ProcessError : public std::runtime_error {
public:
  ProcessError(std::string command, int exit_status, std::string stderr_text);

  [[nodiscard]] const std::string &command() const { return command_; }
  [[nodiscard]] int exit_status() const { return exit_status_; }
  [[nodiscard]] const std::string &stderr_text() const { return stderr_text_; }

private:
  std::string command_;
  int exit_status_;
  std::string stderr_text_;
};

} // namespace gitsync
