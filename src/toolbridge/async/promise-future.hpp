#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>

/**
 * @defgroup async Async
 * @ingroup toolbridge
 *
 * A one-shot result slot shared between a producer (`Promise`) and a single
 * consumer (`Future`). The consumer may cancel the slot while it is still
 * unset; a later `set_value` is then silently discarded. This is the handoff
 * the synchronous bridge uses between the caller thread and the background
 * execution context.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * Promise<int> promise;
 * auto future = promise.get_future();
 * post(executor, [p = std::move(promise)]() mutable { p.set_value(42); });
 * if(future.wait_until(deadline) == std::future_status::timeout && future.try_cancel())
 *    return timed_out();
 * return future.get();
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace toolbridge::async
{
template<typename R> class Promise;
template<typename R> class Future;

namespace detail
{
   template<typename R> class PromiseFutureSharedState
   {
    public:
      enum class Status : int8_t { UNSET, SET, CANCELLED };

    private:
      mutable std::mutex padlock_      = {};
      std::condition_variable cv_      = {};
      std::optional<R> value_          = {};
      std::atomic<Status> status_      = Status::UNSET;
      bool future_is_retreived_        = false;

      Status load_status_() const { return status_.load(std::memory_order_acquire); }

      void notify_locked_(Status new_status)
      {
         status_.store(new_status, std::memory_order_release);
         cv_.notify_all();
      }

    public:
      ///@{ getters
      bool promise_is_unset() const { return load_status_() == Status::UNSET; }
      bool is_ready() const { return load_status_() == Status::SET; }
      bool is_cancelled() const { return load_status_() == Status::CANCELLED; }
      ///@}

      void flag_future_has_been_retreived()
      {
         std::lock_guard lock{padlock_};
         if(future_is_retreived_)
            throw std::future_error{std::future_errc::future_already_retrieved};
         future_is_retreived_ = true;
      }

      /**
       * @return true iff the state moved from UNSET to CANCELLED
       */
      bool try_cancel()
      {
         std::lock_guard lock{padlock_};
         if(load_status_() != Status::UNSET) return false;
         notify_locked_(Status::CANCELLED);
         return true;
      }

      ///@{ wait
      Status wait()
      {
         std::unique_lock lock{padlock_};
         cv_.wait(lock, [this]() { return !promise_is_unset(); });
         return load_status_();
      }

      template<typename Clock, typename Duration>
      std::future_status wait_until(const std::chrono::time_point<Clock, Duration>& deadline)
      {
         std::unique_lock lock{padlock_};
         const bool done = cv_.wait_until(lock, deadline, [this]() { return !promise_is_unset(); });
         return done ? std::future_status::ready : std::future_status::timeout;
      }
      ///@}

      ///@{ get/set value
      R get()
      {
         if(wait() == Status::CANCELLED)
            throw std::future_error{std::future_errc::broken_promise};
         std::lock_guard lock{padlock_};
         assert(value_.has_value());
         return std::move(*value_);
      }

      /**
       * @return false iff the slot was cancelled, and `new_value` discarded.
       */
      template<typename T> bool set_value(T&& new_value)
      {
         std::lock_guard lock{padlock_};
         const auto status = load_status_();
         if(status == Status::SET)
            throw std::future_error{std::future_errc::promise_already_satisfied};
         else if(status == Status::CANCELLED)
            return false; // do nothing
         value_ = std::forward<T>(new_value);
         notify_locked_(Status::SET);
         return true;
      }
      ///@}
   };
} // namespace detail

// ------------------------------------------------------------------------------------------ Future

/**
 * @ingroup async
 * @brief The consumer side of a one-shot result slot.
 */
template<typename R> class Future final
{
 private:
   using shared_state_type = detail::PromiseFutureSharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   friend class Promise<R>;

   explicit Future(std::shared_ptr<shared_state_type> shared_state)
       : shared_state_{std::move(shared_state)}
   {
      shared_state_->flag_future_has_been_retreived();
   }

   shared_state_type& state_() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      return *shared_state_;
   }

 public:
   Future() noexcept                      = default;
   Future(const Future& o)                = delete;
   Future(Future&& o) noexcept            = default;
   ~Future()                              = default;
   Future& operator=(const Future& o)     = delete;
   Future& operator=(Future&& o) noexcept = default;

   /** @brief True iff the Future is still associated with some Promise. */
   bool valid() const noexcept { return shared_state_ != nullptr; }

   /** @brief True iff the value is set and can be retrieved without blocking. */
   bool is_ready() const noexcept { return valid() && shared_state_->is_ready(); }

   /** @brief True iff the slot was cancelled, or the Promise was dropped unset. */
   bool is_cancelled() const noexcept { return valid() && shared_state_->is_cancelled(); }

   /**
    * @brief Cancel the slot if the value has not been set yet.
    * @return true iff this call cancelled the slot. If false, then the value
    *         (or a broken promise) is available through `get()`.
    */
   bool try_cancel() { return state_().try_cancel(); }

   void wait() { state_().wait(); }

   template<typename Rep, typename Period>
   std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration)
   {
      return state_().wait_until(std::chrono::steady_clock::now() + duration);
   }

   template<typename Clock, typename Duration>
   std::future_status wait_until(const std::chrono::time_point<Clock, Duration>& deadline)
   {
      return state_().wait_until(deadline);
   }

   /**
    * @brief Blocking wait for the value, and then move it out of the slot.
    * @exception std::future_error `broken_promise` if the slot was cancelled,
    *            or `no_state` if `valid() == false`.
    */
   R get()
   {
      auto shared_state = std::move(shared_state_);
      if(shared_state == nullptr) throw std::future_error{std::future_errc::no_state};
      return shared_state->get();
   }
};

// ----------------------------------------------------------------------------------------- Promise

/**
 * @ingroup async
 * @brief The producer side of a one-shot result slot.
 *
 * Destroying a Promise that was never set cancels the slot, so a waiting
 * Future receives `broken_promise` instead of blocking.
 */
template<typename R> class Promise final
{
 private:
   using shared_state_type = detail::PromiseFutureSharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

 public:
   Promise()
       : shared_state_{std::make_shared<shared_state_type>()}
   {}
   Promise(const Promise&)            = delete;
   Promise(Promise&& o) noexcept      = default;
   Promise& operator=(const Promise&) = delete;
   Promise& operator=(Promise&& o) noexcept
   {
      abandon_();
      shared_state_ = std::move(o.shared_state_);
      return *this;
   }
   ~Promise() { abandon_(); }

   /**
    * @exception std::future_error `future_already_retrieved` on a second call.
    */
   Future<R> get_future()
   {
      if(!shared_state_) throw std::future_error{std::future_errc::no_state};
      return Future<R>{shared_state_};
   }

   /**
    * @return false iff the Future cancelled the slot; the value is discarded.
    * @exception std::future_error `promise_already_satisfied` if already set.
    */
   template<typename T> bool set_value(T&& value)
   {
      if(!shared_state_) throw std::future_error{std::future_errc::no_state};
      return shared_state_->set_value(std::forward<T>(value));
   }

 private:
   void abandon_() noexcept
   {
      if(shared_state_ != nullptr) shared_state_->try_cancel();
      shared_state_.reset();
   }
};

} // namespace toolbridge::async
