#include "entry.h"

#include "util.h"

namespace larder {

std::string const &entry_name(entry_t const &entry) {
  return std::visit([](auto const &e) -> std::string const & { return e.name; }, entry);
}

std::string_view entry_type_name(entry_t const &entry) {
  return std::visit(match{ [](ingredient const &) -> std::string_view { return "ingredient"; },
                           [](recipe const &) -> std::string_view { return "recipe"; } },
                    entry);
}

}  // namespace larder
