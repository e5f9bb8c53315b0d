#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup toolbridge-utils
 *
 * Transport and framing failures are reported as `std::error_code`s in the
 * `ecode` category. Failures visible to a caller of a remote tool are
 * `net::Status` values instead.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The worker closed its stdout in the middle of a frame
 * return make_error_code(ecode::premature_eof);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace toolbridge
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of toolbridge error codes.
 */
enum class ecode : int {
   okay = 0,         //!< i.e., everything's okay.
   system_error,     //!< A system call failed; see `errno` in the log.
   logic_error,      //!< Faulty logic in the program.
   argument_error,   //!< An invalid argument was supplied.
   premature_eof,    //!< Stream ended in the middle of a frame.
   stream_closed,    //!< Stream ended cleanly, or was closed locally.
   object_too_large, //!< Frame length exceeds the maximum frame size.
   invalid_data,     //!< Input data (pipe/file/etc.) was invalid.
   spawn_failed      //!< The worker process could not be started.
};
} // namespace toolbridge

namespace std
{
template<> struct is_error_code_enum<toolbridge::ecode> : true_type
{};
} // namespace std

namespace toolbridge
{
error_code make_error_code(ecode);
} // namespace toolbridge
