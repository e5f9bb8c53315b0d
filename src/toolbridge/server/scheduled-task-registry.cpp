#include "scheduled-task-registry.hpp"

#include <algorithm>

namespace toolbridge::server {

using namespace std::chrono;

ScheduledTaskRegistry::ScheduledTaskRegistry(boost::asio::any_io_executor executor,
                                             Publisher publisher)
    : executor_{executor}, publisher_{std::move(publisher)} {}

ScheduledTaskRegistry::~ScheduledTaskRegistry() {
  alive_.reset();
  cancel_all();
}

// --------------------------------------------------------------------------------------------- add

expected<std::string, net::Status> ScheduledTaskRegistry::add(milliseconds delay,
                                                              std::string message) {
  if (delay.count() <= 0)
    return make_unexpected(net::Status{net::StatusCode::INVALID_ARGUMENT,
                                       format("delay must be positive, got {}ms", delay.count())});
  if (delay > k_max_delay)
    return make_unexpected(
        net::Status{net::StatusCode::INVALID_ARGUMENT,
                    format("delay must be at most {}ms, got {}ms", k_max_delay.count(),
                           delay.count())});

  const auto sequence = next_sequence_++;
  auto id = format("reminder_{}", sequence);

  ScheduledTask task;
  task.sequence = sequence;
  task.fire_at = steady_clock::now() + delay;
  task.message = std::move(message);
  task.timer = make_shared<boost::asio::steady_timer>(executor_, task.fire_at);
  task.timer->async_wait(
      [this, weak = weak_ptr<int>{alive_}, id](const boost::system::error_code& ec) {
        if (ec || weak.expired())
          return; // cancelled
        fire_(id);
      });

  INFO("scheduled {} in {}ms", id, delay.count());
  tasks_.emplace(id, std::move(task));
  return id;
}

// ------------------------------------------------------------------------------------------ cancel

bool ScheduledTaskRegistry::cancel(std::string_view id) {
  auto ii = tasks_.find(std::string{id});
  if (ii == end(tasks_))
    return false;
  ii->second.timer->cancel();
  tasks_.erase(ii);
  INFO("cancelled {}", id);
  return true;
}

std::size_t ScheduledTaskRegistry::cancel_all() {
  const auto counter = tasks_.size();
  for (auto& [id, task] : tasks_)
    task.timer->cancel();
  tasks_.clear();
  return counter;
}

// -------------------------------------------------------------------------------------------- list

std::vector<ScheduledTaskRegistry::TaskInfo> ScheduledTaskRegistry::list() const {
  std::vector<std::pair<uint64_t, TaskInfo>> sorted;
  sorted.reserve(tasks_.size());
  const auto now = steady_clock::now();
  for (const auto& [id, task] : tasks_) {
    const auto remaining = std::max(duration_cast<milliseconds>(task.fire_at - now), 0ms);
    sorted.push_back({task.sequence, TaskInfo{id, remaining, task.message}});
  }
  std::sort(begin(sorted), end(sorted),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<TaskInfo> out;
  out.reserve(sorted.size());
  for (auto& [sequence, info] : sorted)
    out.push_back(std::move(info));
  return out;
}

// ------------------------------------------------------------------------------------------- fire_

void ScheduledTaskRegistry::fire_(const std::string& id) {
  auto ii = tasks_.find(id);
  if (ii == end(tasks_))
    return; // cancelled after the timer expired

  const auto message = std::move(ii->second.message);
  tasks_.erase(ii);
  ++fired_;

  INFO("firing {}", id);
  if (!publisher_ || !publisher_(message))
    INFO("{} fired with no client connected, message discarded", id);
}

} // namespace toolbridge::server
