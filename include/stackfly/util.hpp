#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace stackfly {

// Number of characters (UTF-8 code points) in a string, for column layout.
auto display_width(std::string_view str) -> std::size_t;

// String helpers
namespace strutil {
  // Strip leading/trailing spaces, tabs and a trailing CR
  std::string trim(std::string_view sv);
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);
  // Split a command line into words the way a POSIX shell would for plain
  // words: blanks separate, '...' is literal, "..." honours \" and \\,
  // and a backslash outside quotes escapes the next character.
  // No expansion of any kind. Throws std::runtime_error on an unterminated quote.
  std::vector<std::string> split_command_line(std::string_view sv);
}

}
