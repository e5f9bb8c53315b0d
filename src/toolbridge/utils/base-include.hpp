#pragma once

// ------------------------------------------------------------- Library defines

// Turn on 64bit files, stdio.h
#define _FILE_OFFSET_BITS 64

#ifndef __cplusplus
// --------------------------------------------------------------------------- C
#include <assert.h>
#include <stdio.h>

#else
// ------------------------------------------------------------------------- C++

// Contrib
#include <tl/expected.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#define SPDLOG_FMT_EXTERNAL
#include "spdlog/spdlog.h"

#include "base/logging.hpp"

#include <algorithm>
#include <functional>
#include <memory>

#include <array>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <span>

#include <unordered_map>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace toolbridge {
// -----------------------------------------------------------------------------

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

using fmt::format;

using std::function;
using thunk_type = std::function<void()>;

using std::cerr;
using std::cout;
using std::endl;

using std::array;
using std::string;
using std::string_view;
using std::unordered_map;
using std::vector;

using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;
using std::weak_ptr;

using std::begin;
using std::cbegin;
using std::cend;
using std::end;

using std::error_code;
using std::make_error_code;

using std::lock_guard;

// NOTE:
//        1s is 1 second
using namespace std::literals::chrono_literals;

} // namespace toolbridge

#if defined __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
#endif

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)
#else
#define likely(x) (!!(x))
#define unlikely(x) (!!(x))
#endif

// --------------------------------------------------------------------- Logging

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::toolbridge::logging::detail;                                                 \
    ::toolbridge::logging::log_trace(::toolbridge::logging::debug_logger(),                        \
                                     "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,        \
                                     __LINE__ __VA_OPT__(, ) __VA_ARGS__);                         \
  }

#define LOG_DEBUG(fmt, ...)                                                                        \
  {                                                                                                \
    using namespace ::toolbridge::logging::detail;                                                 \
    ::toolbridge::logging::log_debug(::toolbridge::logging::debug_logger(),                        \
                                     "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,        \
                                     __LINE__ __VA_OPT__(, ) __VA_ARGS__);                         \
  }
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::toolbridge::logging::detail;                                                 \
    ::toolbridge::logging::log_info(::toolbridge::logging::debug_logger(),                         \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#define WARN(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::toolbridge::logging::detail;                                                 \
    ::toolbridge::logging::log_warn(::toolbridge::logging::debug_logger(),                         \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#define LOG_ERR(fmt, ...)                                                                          \
  {                                                                                                \
    using namespace ::toolbridge::logging::detail;                                                 \
    ::toolbridge::logging::log_error(::toolbridge::logging::debug_logger(),                        \
                                     "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,        \
                                     __LINE__ __VA_OPT__(, ) __VA_ARGS__);                         \
  }

#define FATAL(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::toolbridge::logging::detail;                                                 \
    ::toolbridge::logging::log_fatal(::toolbridge::logging::debug_logger(),                        \
                                     "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,        \
                                     __LINE__ __VA_OPT__(, ) __VA_ARGS__);                         \
  }

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
  if (!likely(condition))                                                                          \
    FATAL("precondition failed: {}", #condition);
#endif

#ifdef Ensures
#undef Ensures
#endif
#ifdef NDEBUG
#define Ensures(condition)
#else
#define Ensures(condition)                                                                         \
  if (!likely(condition))                                                                          \
    FATAL("postcondition failed: {}", #condition);
#endif

#if defined __clang__
#pragma clang diagnostic pop
#elif defined __GNUC__
#pragma GCC diagnostic pop
#endif

#endif // #defined cplusplus
