#include "error.h"

namespace larder {

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::INVALID_INPUT: return "InvalidInput";
    case error_kind::DUPLICATE_NAME: return "DuplicateName";
    case error_kind::INVALID_TYPE: return "InvalidType";
    case error_kind::INVALID_FIELD: return "InvalidField";
    case error_kind::DUPLICATE_ITEM: return "DuplicateItem";
    case error_kind::NOT_FOUND: return "NotFound";
    case error_kind::WRONG_TYPE: return "WrongType";
    case error_kind::UNKNOWN_ITEM: return "UnknownItem";
    case error_kind::CIRCULAR_DEPENDENCY: return "CircularDependency";
    case error_kind::QUANTITY_OVERFLOW: return "QuantityOverflow";
  }
  return "Unknown";
}

cookbook_error::cookbook_error(error_kind kind, std::string const &message)
    : std::runtime_error{ message }, kind_{ kind } {}

std::string cookbook_error_format(cookbook_error const &err) {
  return std::string{ error_kind_name(err.kind()) } + ": " + err.what();
}

}  // namespace larder
