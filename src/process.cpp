#include "gitsync/process.hpp"

#include "gitsync/errors.hpp"
#include "gitsync/util.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <poll.h>
#include <stdexcept>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace {

// Repository-local variables git exports to hooks; they would redirect every module's
// commands at the outer repository.
constexpr std::string_view kLocalGitVars[] = {
    "GIT_ALTERNATE_OBJECT_DIRECTORIES", "GIT_CONFIG", "GIT_CONFIG_PARAMETERS_LOCAL",
    "GIT_DIR", "GIT_WORK_TREE", "GIT_COMMON_DIR", "GIT_INDEX_FILE", "GIT_OBJECT_DIRECTORY",
    "GIT_PREFIX", "GIT_NAMESPACE", "GIT_IMPLICIT_WORK_TREE", "GIT_GRAFT_FILE",
    "GIT_NO_REPLACE_OBJECTS", "GIT_REPLACE_REF_BASE", "GIT_SHALLOW_FILE"};

std::mutex &log_mutex() {
  static std::mutex m;
  return m;
}

std::vector<std::string> sanitized_environment() {
  std::vector<std::string> env;
  for (char **e = environ; e && *e; ++e) {
    const std::string_view kv(*e);
    const std::string_view name = kv.substr(0, kv.find('='));
    bool drop = false;
    for (const auto var : kLocalGitVars) {
      if (name == var) {
        drop = true;
        break;
      }
    }
    if (!drop) {
      env.emplace_back(kv);
    }
  }
  return env;
}

struct Pipe {
  int fd[2] = {-1, -1};
  Pipe() {
    if (::pipe2(fd, O_CLOEXEC) != 0) {
      throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  void close_read() {
    if (fd[0] >= 0) {
      ::close(fd[0]);
      fd[0] = -1;
    }
  }
  void close_write() {
    if (fd[1] >= 0) {
      ::close(fd[1]);
      fd[1] = -1;
    }
  }
};

struct Outcome {
  int status = 0;
  std::string out;
  std::string err;
};

Outcome spawn(const std::vector<std::string> &argv, const std::string &input,
              bool inherit_output) {
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

  if (argv.empty()) {
    throw std::runtime_error("spawn: empty command");
  }

  // Everything the child needs is prepared before fork(); pushes run from threads.
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);
  const auto env_storage = sanitized_environment();
  std::vector<char *> envp;
  envp.reserve(env_storage.size() + 1);
  for (const auto &kv : env_storage) {
    envp.push_back(const_cast<char *>(kv.c_str()));
  }
  envp.push_back(nullptr);

  Pipe in, out, err;
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    // Child process: wire the pipes and exec
    ::dup2(in.fd[0], STDIN_FILENO);
    if (!inherit_output) {
      ::dup2(out.fd[1], STDOUT_FILENO);
      ::dup2(err.fd[1], STDERR_FILENO);
    }
    ::execvpe(args[0], args.data(), envp.data());
    constexpr char kMsg[] = "exec failed\n";
    (void)!::write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
    ::_exit(127);
  }

  in.close_read();
  out.close_write();
  err.close_write();
  if (inherit_output) {
    out.close_read();
    err.close_read();
  }
  if (input.empty()) {
    in.close_write();
  } else {
    ::fcntl(in.fd[1], F_SETFL, ::fcntl(in.fd[1], F_GETFL) | O_NONBLOCK);
  }

  Outcome res;
  std::size_t written = 0;
  char buf[65536];
  while (out.fd[0] >= 0 || err.fd[0] >= 0 || in.fd[1] >= 0) {
    pollfd fds[3];
    nfds_t n = 0;
    int idx_out = -1, idx_err = -1, idx_in = -1;
    if (out.fd[0] >= 0) {
      idx_out = static_cast<int>(n);
      fds[n++] = pollfd{out.fd[0], POLLIN, 0};
    }
    if (err.fd[0] >= 0) {
      idx_err = static_cast<int>(n);
      fds[n++] = pollfd{err.fd[0], POLLIN, 0};
    }
    if (in.fd[1] >= 0) {
      idx_in = static_cast<int>(n);
      fds[n++] = pollfd{in.fd[1], POLLOUT, 0};
    }
    if (::poll(fds, n, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
    }

    const auto drain = [&](int idx, Pipe &p, std::string &sink) {
      if (idx < 0 || fds[idx].revents == 0) {
        return;
      }
      const ssize_t r = ::read(p.fd[0], buf, sizeof(buf));
      if (r > 0) {
        sink.append(buf, static_cast<std::size_t>(r));
      } else if (r == 0 || errno != EINTR) {
        p.close_read();
      }
    };
    drain(idx_out, out, res.out);
    drain(idx_err, err, res.err);

    if (idx_in >= 0 && fds[idx_in].revents != 0) {
      const ssize_t w = ::write(in.fd[1], input.data() + written, input.size() - written);
      if (w > 0) {
        written += static_cast<std::size_t>(w);
        if (written == input.size()) {
          in.close_write();
        }
      } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
        // EPIPE: the child stopped reading; its exit status tells the rest.
        in.close_write();
      }
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }
  if (WIFEXITED(status)) {
    res.status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    res.status = 128 + WTERMSIG(status);
  } else {
    res.status = -1;
  }
  return res;
}

} // namespace

namespace gitsync {

void log_line(const std::string &line) {
  const std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << line << '\n';
}

std::string Runner::capture(const Command &cmd) const {
  const std::string text = shell_join(cmd.argv);
  if (dry_run_ && cmd.effect == Effect::Mutating) {
    log_line("would run: " + text);
    return {};
  }
  if (verbose_) {
    log_line("+ " + text);
  }
  if (cmd.inherit_output) {
    std::cout.flush();
  }
  auto res = spawn(cmd.argv, cmd.input, cmd.inherit_output);
  if (res.status != 0) {
    strutil::rstrip_newlines(res.err);
    throw ProcessError(text, res.status, std::move(res.err));
  }
  if (verbose_ && !res.err.empty()) {
    strutil::rstrip_newlines(res.err);
    log_line(res.err);
  }
  return std::move(res.out);
}

void Runner::run(const Command &cmd) const { (void)capture(cmd); }

std::string Runner::value(const Command &cmd) const {
  std::string out = capture(cmd);
  strutil::rstrip_newlines(out);
  if (out.find('\n') != std::string::npos) {
    throw std::runtime_error("expected a single line from: " + shell_join(cmd.argv));
  }
  return out;
}

std::vector<std::string> Runner::lines(const Command &cmd) const {
  auto out = strutil::split(capture(cmd), '\n');
  for (auto &l : out) {
    strutil::rstrip_newlines(l);
  }
  return out;
}

std::vector<std::string> Runner::records(const Command &cmd) const {
  return strutil::split(capture(cmd), '\0');
}

} // namespace gitsync
