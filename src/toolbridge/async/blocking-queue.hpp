#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace toolbridge::async
{
/**
 * @ingroup async
 * @brief A thread-safe FIFO queue, with non-blocking and bounded-blocking pops.
 *
 * With `capacity == 0` the queue is unbounded. Otherwise pushing onto a full
 * queue drops the oldest item; `dropped()` counts such items.
 */
template<typename T> class BlockingQueue
{
 private:
   mutable std::mutex padlock_;
   std::condition_variable cv_;
   std::deque<T> items_;
   std::size_t capacity_{0};
   std::size_t dropped_{0};
   bool closed_{false};

 public:
   explicit BlockingQueue(std::size_t capacity = 0)
       : capacity_{capacity}
   {}
   BlockingQueue(const BlockingQueue&)            = delete;
   BlockingQueue& operator=(const BlockingQueue&) = delete;

   /**
    * @return false iff the oldest item was dropped to make room for `value`
    */
   bool push(T value)
   {
      bool dropped = false;
      {
         std::lock_guard lock{padlock_};
         if(capacity_ > 0 && items_.size() >= capacity_) {
            items_.pop_front();
            ++dropped_;
            dropped = true;
         }
         items_.push_back(std::move(value));
      }
      cv_.notify_one();
      return !dropped;
   }

   std::optional<T> try_pop()
   {
      std::lock_guard lock{padlock_};
      return pop_locked_();
   }

   /**
    * @brief Wait up to `duration` for an item.
    * @return `nullopt` on timeout, or if the queue is closed and empty.
    */
   template<typename Rep, typename Period>
   std::optional<T> wait_pop(const std::chrono::duration<Rep, Period>& duration)
   {
      std::unique_lock lock{padlock_};
      cv_.wait_for(lock, duration, [this]() { return closed_ || !items_.empty(); });
      return pop_locked_();
   }

   /**
    * @brief Remove and return everything currently queued, in order.
    */
   std::vector<T> drain()
   {
      std::vector<T> out;
      std::lock_guard lock{padlock_};
      out.reserve(items_.size());
      for(auto& item : items_) out.push_back(std::move(item));
      items_.clear();
      return out;
   }

   /**
    * @brief Wake all waiters; subsequent `wait_pop` calls return without blocking.
    */
   void close()
   {
      {
         std::lock_guard lock{padlock_};
         closed_ = true;
      }
      cv_.notify_all();
   }

   bool is_closed() const
   {
      std::lock_guard lock{padlock_};
      return closed_;
   }

   std::size_t size() const
   {
      std::lock_guard lock{padlock_};
      return items_.size();
   }

   std::size_t capacity() const { return capacity_; }

   std::size_t dropped() const
   {
      std::lock_guard lock{padlock_};
      return dropped_;
   }

 private:
   std::optional<T> pop_locked_()
   {
      if(items_.empty()) return std::nullopt;
      std::optional<T> out{std::move(items_.front())};
      items_.pop_front();
      return out;
   }
};

} // namespace toolbridge::async
