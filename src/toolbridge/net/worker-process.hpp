#pragma once

#include "pipe-transport.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace toolbridge::net {

/**
 * @brief The worker process to spawn: `program` is looked up in `PATH`.
 */
struct WorkerCommand {
  std::string program{};
  std::vector<std::string> arguments{};
  std::chrono::milliseconds exit_grace{2'000}; //!< Time to exit on EOF, and then on SIGTERM

  std::string to_string() const;
};

/**
 * @brief A `PipeTransport` connected to the stdin/stdout of a child process.
 *
 * Closing the transport closes the pipes, so the child sees EOF on its stdin.
 * The child is then reaped by a coroutine on the executor, which waits `exit_grace`
 * for it to exit, then sends SIGTERM and waits again, and finally sends SIGKILL.
 * `close` itself never blocks.
 */
class ProcessTransport final : public PipeTransport {
private:
  pid_t pid_{-1};
  std::chrono::milliseconds exit_grace_;

  void reap_();

public:
  ProcessTransport(executor_type executor, pid_t pid, int read_fd, int write_fd,
                   std::chrono::milliseconds exit_grace);
  ~ProcessTransport() override;

  pid_t pid() const { return pid_; }

  void close() override;
};

/**
 * @brief Fork and exec `command`, with its stdin and stdout connected to the
 *        returned transport. The child inherits stderr.
 * @return `ecode::spawn_failed` if the program could not be executed.
 */
expected<shared_ptr<Transport>, error_code> spawn_worker(Transport::executor_type executor,
                                                         const WorkerCommand& command);

} // namespace toolbridge::net
