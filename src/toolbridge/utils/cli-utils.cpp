#include "cli-utils.hpp"

#include "base-include.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace toolbridge::cli
{
namespace
{
   /**
    * @private
    * Advances `i` to the value after the flag, or throws naming the flag.
    */
   const char* next_value(int argc, char** argv, int& i, std::string_view expected_what)
   {
      Expects(argc >= 0);
      Expects(i >= 0 && i < argc);
      const char* flag = argv[i];
      ++i;
      if(i >= argc)
         throw std::runtime_error(format("expected {} after argument '{}'", expected_what, flag));
      return argv[i];
   }
} // namespace

// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief The argument after `argv[i]`, as a string.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i)
{
   return std::string{next_value(argc, argv, i, "string")};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief The argument after `argv[i]`, as a (possibly negative) integer.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an `int`.
 */
int safe_arg_int(int argc, char** argv, int& i)
{
   const char* flag  = argv[i];
   const char* value = next_value(argc, argv, i, "integer");

   char* end      = nullptr;
   errno          = 0;
   const auto ret = std::strtol(value, &end, 10);
   if(end == value || *end != '\0' || errno == ERANGE || ret > std::numeric_limits<int>::max()
      || ret < std::numeric_limits<int>::lowest())
      throw std::runtime_error(format("expected integer after argument '{}'", flag));

   return static_cast<int>(ret);
}

// ------------------------------------------------------------- safe-arg-double
/**
 * @ingroup cli
 * @brief The argument after `argv[i]`, as a finite double.
 *
 * Exceptions:
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as a double.
 */
double safe_arg_double(int argc, char** argv, int& i)
{
   const char* flag  = argv[i];
   const char* value = next_value(argc, argv, i, "numeric");

   char* end      = nullptr;
   const auto ret = std::strtod(value, &end);
   if(end == value || *end != '\0' || !std::isfinite(ret))
      throw std::runtime_error(format("expected numeric after argument '{}'", flag));

   return ret;
}

// ------------------------------------------------------------ safe-arg-seconds

std::chrono::milliseconds safe_arg_seconds(int argc, char** argv, int& i)
{
   const char* flag    = argv[i];
   const double value  = safe_arg_double(argc, argv, i);
   const auto millis   = std::llround(value * 1000.0);
   if(!(value > 0.0) || millis <= 0)
      throw std::runtime_error(format("expected positive seconds after argument '{}'", flag));
   return std::chrono::milliseconds{millis};
}

// ------------------------------------------------------------------ parse args
/**
 * @ingroup cli
 * @brief Parses the passed string as if it were command-line arguments
 *        for a shell command. Returns the arguments as a vector of
 *        strings.
 */
std::vector<std::string> parse_cmd_args(const std::string_view line)
{
   std::vector<std::string> args;
   std::string word;
   bool in_word = false;
   char quote   = '\0'; // the open quote character, if any

   for(std::size_t i = 0; i < line.size(); ++i) {
      const char ch = line[i];
      if(ch == '\\' && quote != '\'' && i + 1 < line.size()) {
         word += line[++i];
         in_word = true;
      } else if(quote != '\0') {
         if(ch == quote)
            quote = '\0';
         else
            word += ch;
      } else if(ch == '\'' || ch == '"') {
         quote   = ch;
         in_word = true;
      } else if(std::isspace(static_cast<unsigned char>(ch))) {
         if(in_word) args.push_back(std::move(word));
         word.clear();
         in_word = false;
      } else {
         word += ch;
         in_word = true;
      }
   }

   if(quote != '\0')
      throw std::runtime_error(format("unterminated {} quote in '{}'", quote, line));
   if(in_word) args.push_back(std::move(word));

   return args;
}

} // namespace toolbridge::cli
