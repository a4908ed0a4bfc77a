// String helpers shared by the config, manifest and listing code
#include "stackfly/util.hpp"

#include <stdexcept>

namespace stackfly {

std::size_t display_width(std::string_view str) {
  std::size_t n = 0;
  for (const char c : str) {
    // count every byte except UTF-8 continuation bytes (10xxxxxx)
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      ++n;
  }
  return n;
}

namespace strutil {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::vector<std::string> split_command_line(std::string_view sv) {
  std::vector<std::string> out;
  std::string word;
  bool in_word = false;
  char quote = 0;

  for (std::size_t i = 0; i < sv.size(); ++i) {
    const char c = sv[i];
    if (quote == '\'') {
      if (c == '\'')
        quote = 0;
      else
        word.push_back(c);
    } else if (quote == '"') {
      if (c == '"') {
        quote = 0;
      } else if (c == '\\' && i + 1 < sv.size() && (sv[i + 1] == '"' || sv[i + 1] == '\\')) {
        word.push_back(sv[++i]);
      } else {
        word.push_back(c);
      }
    } else if (c == ' ' || c == '\t') {
      if (in_word) {
        out.push_back(std::move(word));
        word.clear();
        in_word = false;
      }
    } else {
      in_word = true;
      if (c == '\'' || c == '"')
        quote = c;
      else if (c == '\\' && i + 1 < sv.size())
        word.push_back(sv[++i]);
      else
        word.push_back(c);
    }
  }
  if (quote)
    throw std::runtime_error("unterminated quote in: " + std::string(sv));
  if (in_word)
    out.push_back(std::move(word));
  return out;
}

} // namespace strutil

} // namespace stackfly
