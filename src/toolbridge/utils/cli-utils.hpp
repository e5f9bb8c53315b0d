#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup cli Command Line Utils
 * @ingroup toolbridge-utils
 *
 * Helpers for hand-rolled command-line parsing. Each `safe_arg_*` function reads
 * the value following the flag at `argv[i]`, advances `i` past it, and throws
 * `std::runtime_error` naming the flag if the value is missing or malformed.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * for(int i = 1; i < argc; ++i) {
 *    string arg = argv[i];
 *    if(arg == "--timeout") config.timeout = cli::safe_arg_seconds(argc, argv, i);
 * }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace toolbridge::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);
double safe_arg_double(int argc, char** argv, int& i);

/**
 * @brief A strictly positive number of seconds (fractions allowed), as milliseconds.
 */
std::chrono::milliseconds safe_arg_seconds(int argc, char** argv, int& i);

// ------------------------------------------------------------------ parse args

/**
 * @brief Split `line` into words the way a shell would: whitespace separates words,
 *        single or double quotes group them, and a backslash escapes the next character.
 * @exception std::runtime_error on an unterminated quote.
 */
std::vector<std::string> parse_cmd_args(const std::string_view line);

} // namespace toolbridge::cli
