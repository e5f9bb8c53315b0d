
#include "stdinc.hpp"

#include "toolbridge/async/blocking-queue.hpp"

#include <catch2/catch_all.hpp>

#include <thread>

namespace toolbridge::async::test {

using namespace std::chrono;

CATCH_TEST_CASE("blocking-queue", "[blocking-queue]") {

  CATCH_SECTION("fifo-order") {
    BlockingQueue<int> queue;
    for (int i = 0; i < 5; ++i)
      CATCH_REQUIRE(queue.push(i));
    CATCH_REQUIRE(queue.size() == 5);
    CATCH_REQUIRE(queue.try_pop() == 0);
    CATCH_REQUIRE(queue.drain() == std::vector<int>{1, 2, 3, 4});
    CATCH_REQUIRE_FALSE(queue.try_pop().has_value());
  }

  CATCH_SECTION("capacity-drops-oldest") {
    BlockingQueue<int> queue{2};
    CATCH_REQUIRE(queue.push(1));
    CATCH_REQUIRE(queue.push(2));
    CATCH_REQUIRE_FALSE(queue.push(3));
    CATCH_REQUIRE_FALSE(queue.push(4));
    CATCH_REQUIRE(queue.dropped() == 2);
    CATCH_REQUIRE(queue.drain() == std::vector<int>{3, 4});
  }

  CATCH_SECTION("wait-pop-is-bounded") {
    BlockingQueue<int> queue;
    const auto start = steady_clock::now();
    CATCH_REQUIRE_FALSE(queue.wait_pop(30ms).has_value());
    CATCH_REQUIRE(steady_clock::now() - start >= 30ms);
  }

  CATCH_SECTION("wait-pop-wakes-on-push") {
    BlockingQueue<std::string> queue;
    std::thread producer{[&queue]() {
      std::this_thread::sleep_for(10ms);
      queue.push("ding");
    }};
    const auto value = queue.wait_pop(5s);
    producer.join();
    CATCH_REQUIRE(value == std::string{"ding"});
  }

  CATCH_SECTION("close-wakes-waiters") {
    BlockingQueue<int> queue;
    std::thread closer{[&queue]() {
      std::this_thread::sleep_for(10ms);
      queue.close();
    }};
    const auto start = steady_clock::now();
    CATCH_REQUIRE_FALSE(queue.wait_pop(5s).has_value());
    CATCH_REQUIRE(steady_clock::now() - start < 4s);
    closer.join();
    CATCH_REQUIRE(queue.is_closed());
  }
}

} // namespace toolbridge::async::test
