#include "normalize.h"

#include "error.h"

#include <vector>

namespace larder {

namespace {

bool is_separator(char c) { return c == '-' || c == '_' || c == ' '; }

bool is_ascii_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

char to_upper(char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }

char to_lower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

}  // namespace

std::optional<std::string> normalize_name(std::string_view input) {
  std::vector<std::string> tokens;
  std::string current;

  auto const flush{ [&] {
    if (!current.empty()) { tokens.push_back(std::move(current)); }
    current.clear();
  } };

  for (char const c : input) {
    if (is_separator(c)) {
      flush();
    } else if (is_ascii_letter(c)) {
      current.push_back(current.empty() ? to_upper(c) : to_lower(c));
    }
  }
  flush();

  if (tokens.empty()) { return std::nullopt; }

  std::string result{ std::move(tokens.front()) };
  for (size_t i{ 1 }; i < tokens.size(); ++i) {
    result.push_back(' ');
    result.append(tokens[i]);
  }
  return result;
}

std::string normalize_name_or_throw(std::string_view input) {
  auto result{ normalize_name(input) };
  if (!result) { throw cookbook_error(error_kind::INVALID_INPUT, "Invalid recipe name"); }
  return std::move(*result);
}

}  // namespace larder
