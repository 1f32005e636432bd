#include "diffgate/subprocess.h"

#include "diffgate/log.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace diffgate {

namespace {
constexpr int kExitNotFound = 127;
constexpr int kExitChdirFailed = 126;

bool make_pipe(int fds[2]) {
  if (::pipe(fds) != 0) return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Drains both pipes until EOF so neither child stream can block on a full buffer.
void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
  char buffer[4096];
  while (out_fd >= 0 || err_fd >= 0) {
    pollfd fds[2];
    nfds_t count = 0;
    if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
    if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};
    const int ready = ::poll(fds, count, -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
      const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        (fds[i].fd == out_fd ? out : err).append(buffer, static_cast<size_t>(n));
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      if (fds[i].fd == out_fd) {
        close_fd(out_fd);
      } else {
        close_fd(err_fd);
      }
    }
  }
  close_fd(out_fd);
  close_fd(err_fd);
}
} // namespace

std::string CommandResult::diagnostic(size_t limit) const {
  std::string text = !stderr_text.empty() ? stderr_text : (!stdout_text.empty() ? stdout_text : error_message);
  if (text.size() > limit) {
    text.resize(limit);
  }
  return text;
}

CommandResult run_command(const CommandSpec& spec) {
  log::debug("exec: " + describe_command(spec.args));
  CommandResult result;
  if (spec.args.empty()) {
    result.error_message = "missing command";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (!make_pipe(out_pipe)) {
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }
  if (!make_pipe(err_pipe)) {
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return result;
  }

  std::vector<char*> cargs;
  cargs.reserve(spec.args.size() + 1);
  for (const auto& arg : spec.args) {
    cargs.push_back(const_cast<char*>(arg.c_str()));
  }
  cargs.push_back(nullptr);
  const std::string cwd = spec.cwd.string();

  const pid_t pid = ::fork();
  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      _exit(kExitChdirFailed);
    }
    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDIN_FILENO);
      ::close(null_fd);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(cargs[0], cargs.data());
    _exit(kExitNotFound);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  if (pid < 0) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    result.error_message = std::string("fork failed: ") + std::strerror(errno);
    log::error("spawn failed: " + describe_command(spec.args) + ": " + result.error_message);
    return result;
  }

  result.started = true;
  drain(out_pipe[0], err_pipe[0], result.stdout_text, result.stderr_text);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.error_message = std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
    result.error_message = "terminated by signal " + std::to_string(WTERMSIG(status));
  }
  if (result.exit_code == kExitNotFound && result.stderr_text.empty()) {
    result.error_message = "command not found: " + spec.args.front();
    log::error(result.error_message);
  } else if (result.exit_code == kExitChdirFailed && result.stderr_text.empty()) {
    result.error_message = "cannot enter working directory: " + cwd;
    log::error(result.error_message);
  }
  return result;
}

std::string describe_command(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& arg : args) {
    if (!out.empty()) out.push_back(' ');
    if (arg.find_first_of(" \t'\"") == std::string::npos) {
      out += arg;
    } else {
      out += "'" + arg + "'";
    }
  }
  return out;
}

} // namespace diffgate
