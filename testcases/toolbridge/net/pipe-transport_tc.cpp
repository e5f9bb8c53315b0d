
#include "stdinc.hpp"

#include "toolbridge/net/pipe-transport.hpp"
#include "toolbridge/net/worker-process.hpp"
#include "toolbridge/utils/error-codes.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/endian/conversion.hpp>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <unistd.h>

namespace toolbridge::net::test {

using boost::asio::awaitable;

static awaitable<void> read_frames(shared_ptr<Transport> transport, std::size_t count,
                                   std::vector<std::string>& frames, error_code& last_error) {
  BufferType frame;
  while (frames.size() < count) {
    last_error = co_await transport->async_read_frame(frame);
    if (last_error)
      co_return;
    frames.emplace_back(to_string_view(to_span_bytes(frame)));
  }
}

CATCH_TEST_CASE("pipe-transport", "[pipe-transport]") {
  boost::asio::io_context io_context;
  auto executor = io_context.get_executor();

  CATCH_SECTION("frames-arrive-in-order") {
    auto pair = make_pipe_pair(executor, executor);
    CATCH_REQUIRE(pair.has_value());
    auto [a, b] = *pair;

    a->send_frame(make_send_buffer("one"));
    a->send_frame(make_send_buffer(""));
    a->send_frame(make_send_buffer(std::string(100'000, 'x')));

    std::vector<std::string> frames;
    error_code ec;
    boost::asio::co_spawn(io_context, read_frames(b, 3, frames, ec), boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(!ec);
    CATCH_REQUIRE(frames.size() == 3);
    CATCH_REQUIRE(frames[0] == "one");
    CATCH_REQUIRE(frames[1] == "");
    CATCH_REQUIRE(frames[2] == std::string(100'000, 'x'));
  }

  CATCH_SECTION("close-ends-the-peer-stream") {
    auto pair = make_pipe_pair(executor, executor);
    CATCH_REQUIRE(pair.has_value());
    auto [a, b] = *pair;

    a->send_frame(make_send_buffer("last words"));

    std::vector<std::string> frames;
    error_code first_ec, second_ec;
    boost::asio::co_spawn(
        io_context,
        [&, a = a, b = b]() -> awaitable<void> {
          co_await read_frames(b, 1, frames, first_ec);
          a->close();
          co_await read_frames(b, 2, frames, second_ec);
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE_FALSE(a->is_open());
    CATCH_REQUIRE(!first_ec);
    CATCH_REQUIRE(frames == std::vector<std::string>{"last words"});
    CATCH_REQUIRE(second_ec == make_error_code(ecode::stream_closed));
  }

  CATCH_SECTION("oversized-frame-is-rejected") {
    int fds[2] = {-1, -1};
    CATCH_REQUIRE(::pipe2(fds, O_CLOEXEC) == 0);
    const auto length = boost::endian::native_to_big(uint32_t(k_max_frame_size + 1));
    CATCH_REQUIRE(::write(fds[1], &length, sizeof(length)) == sizeof(length));

    auto transport = make_shared<PipeTransport>(executor, fds[0], fds[1]);
    std::vector<std::string> frames;
    error_code ec;
    boost::asio::co_spawn(io_context, read_frames(transport, 1, frames, ec),
                          boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(ec == make_error_code(ecode::object_too_large));
  }

  CATCH_SECTION("truncated-frame-is-premature-eof") {
    int fds[2] = {-1, -1};
    CATCH_REQUIRE(::pipe2(fds, O_CLOEXEC) == 0);
    const auto length = boost::endian::native_to_big(uint32_t(10));
    CATCH_REQUIRE(::write(fds[1], &length, sizeof(length)) == sizeof(length));
    CATCH_REQUIRE(::write(fds[1], "abc", 3) == 3);
    ::close(fds[1]);

    int sink[2] = {-1, -1};
    CATCH_REQUIRE(::pipe2(sink, O_CLOEXEC) == 0);
    ::close(sink[0]);

    auto transport = make_shared<PipeTransport>(executor, fds[0], sink[1]);
    std::vector<std::string> frames;
    error_code ec;
    boost::asio::co_spawn(io_context, read_frames(transport, 1, frames, ec),
                          boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(ec == make_error_code(ecode::premature_eof));
  }

  CATCH_SECTION("spawned-worker-echoes-frames") {
    // `cat` copies its stdin to its stdout, so frames come straight back
    auto transport = spawn_worker(executor, WorkerCommand{"cat", {}});
    CATCH_REQUIRE(transport.has_value());

    (*transport)->send_frame(make_send_buffer("ping"));
    (*transport)->send_frame(make_send_buffer("pong"));

    std::vector<std::string> frames;
    error_code ec;
    boost::asio::co_spawn(io_context, read_frames(*transport, 2, frames, ec),
                          boost::asio::detached);
    io_context.run();
    (*transport)->close();
    io_context.restart();
    io_context.run(); // reaps `cat`

    CATCH_REQUIRE(!ec);
    CATCH_REQUIRE(frames == std::vector<std::string>{"ping", "pong"});
  }

  CATCH_SECTION("worker-exiting-on-eof-is-not-signalled") {
    const auto log_path = format("/tmp/toolbridge-worker-exit-{}.log", ::getpid());
    ::unlink(log_path.c_str());
    const auto script = format(
        "trap 'echo sigterm >> {0}; exit 0' TERM; cat > /dev/null; echo eof >> {0}", log_path);

    auto transport = spawn_worker(executor, WorkerCommand{"sh", {"-c", script}, 5s});
    CATCH_REQUIRE(transport.has_value());
    const auto pid = std::static_pointer_cast<ProcessTransport>(*transport)->pid();

    (*transport)->close();
    io_context.run();
    CATCH_REQUIRE(::kill(pid, 0) != 0); // reaped

    std::ifstream log_file{log_path};
    const std::string contents{std::istreambuf_iterator<char>{log_file},
                               std::istreambuf_iterator<char>{}};
    ::unlink(log_path.c_str());
    CATCH_REQUIRE(contents == "eof\n");
  }

  CATCH_SECTION("worker-ignoring-eof-is-terminated-without-blocking-close") {
    auto transport = spawn_worker(executor, WorkerCommand{"sleep", {"30"}, 50ms});
    CATCH_REQUIRE(transport.has_value());
    const auto pid = std::static_pointer_cast<ProcessTransport>(*transport)->pid();

    const auto start = std::chrono::steady_clock::now();
    (*transport)->close();
    CATCH_REQUIRE(std::chrono::steady_clock::now() - start < 50ms);
    CATCH_REQUIRE(::kill(pid, 0) == 0); // still running

    io_context.run();
    CATCH_REQUIRE(std::chrono::steady_clock::now() - start >= 50ms);
    CATCH_REQUIRE(::kill(pid, 0) != 0); // terminated and reaped
  }

  CATCH_SECTION("spawn-failure-is-reported") {
    auto transport =
        spawn_worker(executor, WorkerCommand{"/nonexistent/toolbridge-worker", {"--flag"}});
    CATCH_REQUIRE_FALSE(transport.has_value());
    CATCH_REQUIRE(transport.error() == make_error_code(ecode::spawn_failed));
  }
}

} // namespace toolbridge::net::test
