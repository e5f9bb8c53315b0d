#include "worker-process.hpp"

#include "co-spawn.hpp"

#include "toolbridge/utils/error-codes.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolbridge::net {

std::string WorkerCommand::to_string() const {
  std::string out = program;
  for (const auto& argument : arguments) {
    out += ' ';
    out += argument;
  }
  return out;
}

// ---------------------------------------------------------------------------------------- reaping

namespace {
  constexpr auto k_poll_interval = 10ms;

  /// true once `pid` has exited and been reaped
  bool try_reap(pid_t pid) {
    int status = 0;
    const auto ret = ::waitpid(pid, &status, WNOHANG);
    if (ret == pid) {
      if (WIFSIGNALED(status)) {
        INFO("worker {} terminated by signal {}", pid, WTERMSIG(status));
      } else {
        LOG_DEBUG("worker {} exited with status {}", pid, WEXITSTATUS(status));
      }
      return true;
    }
    return ret < 0 && errno == ECHILD;
  }

  boost::asio::awaitable<bool> wait_for_exit(pid_t pid, boost::asio::steady_timer& timer,
                                             std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (!try_reap(pid)) {
      if (std::chrono::steady_clock::now() >= deadline)
        co_return false;
      timer.expires_after(k_poll_interval);
      boost::system::error_code ec;
      co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return true;
  }

  boost::asio::awaitable<void> reap_worker(pid_t pid, std::chrono::milliseconds grace) {
    boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};

    if (co_await wait_for_exit(pid, timer, grace))
      co_return;
    WARN("worker {} did not exit on EOF, sending SIGTERM", pid);
    ::kill(pid, SIGTERM);

    if (co_await wait_for_exit(pid, timer, grace))
      co_return;
    WARN("worker {} ignored SIGTERM, sending SIGKILL", pid);
    ::kill(pid, SIGKILL);

    if (!co_await wait_for_exit(pid, timer, grace))
      LOG_ERR("worker {} survived SIGKILL", pid);
  }
} // namespace

// -------------------------------------------------------------------------------- ProcessTransport

ProcessTransport::ProcessTransport(executor_type executor, pid_t pid, int read_fd, int write_fd,
                                   std::chrono::milliseconds exit_grace)
    : PipeTransport{executor, read_fd, write_fd}, pid_{pid}, exit_grace_{exit_grace} {}

ProcessTransport::~ProcessTransport() {
  PipeTransport::close();
  reap_();
}

void ProcessTransport::close() {
  PipeTransport::close();
  reap_();
}

void ProcessTransport::reap_() {
  if (pid_ <= 0)
    return;
  const auto pid = std::exchange(pid_, -1);
  if (try_reap(pid))
    return;
  boost::asio::co_spawn(get_executor(), reap_worker(pid, exit_grace_),
                        log_on_exception("worker reaper"));
}

// ------------------------------------------------------------------------------------ spawn_worker

namespace {
  void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i)
      if (fds[i] >= 0)
        ::close(fds[i]);
  }
} // namespace

expected<shared_ptr<Transport>, error_code> spawn_worker(Transport::executor_type executor,
                                                         const WorkerCommand& command) {
  if (command.program.empty())
    return make_unexpected(make_error_code(ecode::argument_error));

  int to_child[2] = {-1, -1};
  int from_child[2] = {-1, -1};
  int exec_error[2] = {-1, -1}; // reports errno if execvp fails
  if (::pipe2(to_child, O_CLOEXEC) != 0 || ::pipe2(from_child, O_CLOEXEC) != 0 ||
      ::pipe2(exec_error, O_CLOEXEC) != 0) {
    LOG_ERR("failed to create pipes for worker: {}", std::strerror(errno));
    close_pipe(to_child);
    close_pipe(from_child);
    close_pipe(exec_error);
    return make_unexpected(make_error_code(ecode::spawn_failed));
  }

  // Build argv before forking: no allocation in the child
  std::vector<char*> argv;
  argv.reserve(command.arguments.size() + 2);
  argv.push_back(const_cast<char*>(command.program.c_str()));
  for (const auto& argument : command.arguments)
    argv.push_back(const_cast<char*>(argument.c_str()));
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    LOG_ERR("fork failed: {}", std::strerror(errno));
    close_pipe(to_child);
    close_pipe(from_child);
    close_pipe(exec_error);
    return make_unexpected(make_error_code(ecode::spawn_failed));
  }

  if (pid == 0) { // child
    ::dup2(to_child[0], STDIN_FILENO);
    ::dup2(from_child[1], STDOUT_FILENO);
    ::execvp(argv[0], argv.data());
    const int error = errno;
    [[maybe_unused]] auto ret = ::write(exec_error[1], &error, sizeof(error));
    ::_exit(127);
  }

  ::close(to_child[0]);
  ::close(from_child[1]);
  ::close(exec_error[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_error[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(exec_error[0]);

  if (n == sizeof(child_errno)) {
    LOG_ERR("failed to execute '{}': {}", command.to_string(), std::strerror(child_errno));
    ::close(to_child[1]);
    ::close(from_child[0]);
    int status = 0;
    ::waitpid(pid, &status, 0);
    return make_unexpected(make_error_code(ecode::spawn_failed));
  }

  INFO("spawned worker '{}', pid={}", command.to_string(), pid);
  return make_shared<ProcessTransport>(executor, pid, from_child[0], to_child[1],
                                       command.exit_grace);
}

} // namespace toolbridge::net
