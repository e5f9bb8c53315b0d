#pragma once

#include "toolbridge/net/rpc/status.hpp"

#include "stdinc.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace toolbridge::server {

/**
 * @brief Cancellable, delayed notifications (reminders), each fired at most once.
 *
 * Every task owns one timer on `executor`. When the timer expires the task is
 * removed from the registry, and then its message is handed to the publisher.
 * A publisher that fails (e.g., no client connected) is logged; the message is
 * not retried.
 *
 * Not thread-safe: all methods must be called on `executor`, which is also where
 * the timers fire. Task ids are never reused.
 */
class ScheduledTaskRegistry {
public:
  /**
   * @return false iff the message could not be delivered
   */
  using Publisher = std::function<bool(const std::string& message)>;

  /**
   * @brief The longest delay `add` accepts: 365 days.
   */
  static constexpr std::chrono::milliseconds k_max_delay{std::chrono::hours{24 * 365}};

  struct TaskInfo {
    std::string id{};
    std::chrono::milliseconds remaining{0}; //!< Never negative
    std::string message{};
  };

private:
  struct ScheduledTask {
    uint64_t sequence{0};
    std::chrono::steady_clock::time_point fire_at{};
    std::string message{};
    shared_ptr<boost::asio::steady_timer> timer{};
  };

  boost::asio::any_io_executor executor_;
  Publisher publisher_;
  std::unordered_map<std::string, ScheduledTask> tasks_;
  uint64_t next_sequence_{1};
  uint64_t fired_{0};
  shared_ptr<int> alive_{make_shared<int>(0)}; //!< Guards timer handlers against `this` dying

  void fire_(const std::string& id);

public:
  ScheduledTaskRegistry(boost::asio::any_io_executor executor, Publisher publisher);
  ScheduledTaskRegistry(const ScheduledTaskRegistry&) = delete;
  ScheduledTaskRegistry& operator=(const ScheduledTaskRegistry&) = delete;
  ~ScheduledTaskRegistry();

  /**
   * @brief Schedule `message` to be published after `delay`.
   * @return The new task's id, or `INVALID_ARGUMENT` if `delay` is not positive, or
   *         longer than `k_max_delay`.
   */
  expected<std::string, net::Status> add(std::chrono::milliseconds delay, std::string message);

  /**
   * @return true iff the task was pending, and is now cancelled. False if it never
   *         existed, has already fired, or was already cancelled.
   */
  bool cancel(std::string_view id);

  /**
   * @brief Pending tasks in creation order, with the time left until each fires.
   */
  std::vector<TaskInfo> list() const;

  /**
   * @brief Cancel every pending task.
   * @return The number of tasks cancelled.
   */
  std::size_t cancel_all();

  std::size_t size() const { return tasks_.size(); }
  bool empty() const { return tasks_.empty(); }

  /** @brief Number of tasks that have fired (successfully published or not) */
  uint64_t fired() const { return fired_; }
};

} // namespace toolbridge::server
