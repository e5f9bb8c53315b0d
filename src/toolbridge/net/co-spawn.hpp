#pragma once

#include "stdinc.hpp"

#include <exception>
#include <string>

namespace toolbridge::net {

/**
 * @brief Completion token for `boost::asio::co_spawn` of an `awaitable<void>`.
 *        An exception escaping the coroutine is logged with `what` as context.
 */
inline auto log_on_exception(std::string what) {
  return [what = std::move(what)](std::exception_ptr ex_ptr) {
    if (ex_ptr == nullptr)
      return;
    try {
      std::rethrow_exception(ex_ptr);
    } catch (const std::exception& e) {
      LOG_ERR("{}: uncaught exception: {}", what, e.what());
    }
  };
}

} // namespace toolbridge::net
