#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace larder {

enum class error_kind {
  INVALID_INPUT,         // Free-text name normalizes to nothing
  DUPLICATE_NAME,        // Entry name already registered
  INVALID_TYPE,          // Entry type is neither ingredient nor recipe
  INVALID_FIELD,         // Negative or missing cook time / quantity
  DUPLICATE_ITEM,        // Required item named twice within one recipe
  NOT_FOUND,             // Queried name is not registered
  WRONG_TYPE,            // Queried name is an ingredient
  UNKNOWN_ITEM,          // Required item references nothing (found at resolution)
  CIRCULAR_DEPENDENCY,   // Recipe transitively requires itself
  QUANTITY_OVERFLOW,     // Resolved quantity or cook time exceeds int64
};

// CamelCase name used on every external surface (CLI output, Lua errors, traces).
std::string_view error_kind_name(error_kind kind);

class cookbook_error : public std::runtime_error {
 public:
  cookbook_error(error_kind kind, std::string const &message);

  error_kind kind() const noexcept { return kind_; }

 private:
  error_kind kind_;
};

// "<Kind>: <message>"
std::string cookbook_error_format(cookbook_error const &err);

}  // namespace larder
