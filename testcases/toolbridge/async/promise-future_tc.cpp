
#include "stdinc.hpp"

#include "toolbridge/async/promise-future.hpp"

#include <catch2/catch_all.hpp>

#include <thread>

namespace toolbridge::async::test {

using namespace std::chrono;

CATCH_TEST_CASE("promise-future", "[promise-future]") {

  CATCH_SECTION("value-set-from-another-thread") {
    Promise<std::string> promise;
    auto future = promise.get_future();
    std::thread thread{[p = std::move(promise)]() mutable {
      std::this_thread::sleep_for(10ms);
      p.set_value(std::string{"hello"});
    }};
    CATCH_REQUIRE(future.wait_until(steady_clock::now() + 5s) == std::future_status::ready);
    CATCH_REQUIRE(future.get() == "hello");
    CATCH_REQUIRE_FALSE(future.valid());
    thread.join();
  }

  CATCH_SECTION("wait-until-times-out") {
    Promise<int> promise;
    auto future = promise.get_future();
    const auto start = steady_clock::now();
    CATCH_REQUIRE(future.wait_until(start + 50ms) == std::future_status::timeout);
    CATCH_REQUIRE(steady_clock::now() - start >= 50ms);
    CATCH_REQUIRE(future.wait_for(1ms) == std::future_status::timeout);
  }

  CATCH_SECTION("cancelled-slot-discards-value") {
    Promise<int> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE(future.try_cancel());
    CATCH_REQUIRE_FALSE(future.try_cancel());
    CATCH_REQUIRE(future.is_cancelled());
    CATCH_REQUIRE_FALSE(promise.set_value(42));
  }

  CATCH_SECTION("cancel-after-set-fails") {
    Promise<int> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE(promise.set_value(42));
    CATCH_REQUIRE_FALSE(future.try_cancel());
    CATCH_REQUIRE(future.is_ready());
    CATCH_REQUIRE(future.get() == 42);
  }

  CATCH_SECTION("set-twice-throws") {
    Promise<int> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE(promise.set_value(1));
    CATCH_REQUIRE_THROWS_AS(promise.set_value(2), std::future_error);
  }

  CATCH_SECTION("future-retrieved-twice-throws") {
    Promise<int> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE_THROWS_AS(promise.get_future(), std::future_error);
  }

  CATCH_SECTION("dropped-promise-breaks-future") {
    Future<int> future;
    {
      Promise<int> promise;
      future = promise.get_future();
    }
    CATCH_REQUIRE(future.wait_for(1s) == std::future_status::ready);
    try {
      future.get();
      CATCH_REQUIRE(false); // should have thrown
    } catch (std::future_error& e) {
      CATCH_REQUIRE(e.code() == std::future_errc::broken_promise);
    }
  }
}

} // namespace toolbridge::async::test
