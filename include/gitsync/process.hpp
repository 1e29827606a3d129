#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gitsync {

// Mutating commands are skipped in dry-run mode.
enum class Effect : std::uint8_t { ReadOnly, Mutating };

struct Command {
  std::vector<std::string> argv; // argv[0] is looked up in PATH
  std::string input;             // fed to the child's stdin
  Effect effect = Effect::ReadOnly;
  bool inherit_output = false;   // child writes straight to our stdout/stderr
};

// Runs child processes. The call site picks the result shape it expects.
class Runner {
public:
  Runner(bool verbose, bool dry_run) : verbose_(verbose), dry_run_(dry_run) {}

  // No output expected.
  void run(const Command &cmd) const;

  // Exactly one line of output, trailing newline stripped.
  [[nodiscard]] std::string value(const Command &cmd) const;

  // Newline separated output.
  [[nodiscard]] std::vector<std::string> lines(const Command &cmd) const;

  // NUL separated output (git's -z formats).
  [[nodiscard]] std::vector<std::string> records(const Command &cmd) const;

  [[nodiscard]] bool verbose() const { return verbose_; }
  [[nodiscard]] bool dry_run() const { return dry_run_; }

private:
  // Raw stdout; empty when a mutating command was skipped.
  std::string capture(const Command &cmd) const;

  bool verbose_;
  bool dry_run_;
};

// Serialized write of one line to stderr; safe from concurrent pushes.
void log_line(const std::string &line);

} // namespace gitsync
