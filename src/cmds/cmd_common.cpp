#include "cmd_common.h"

#include "cookbook.h"
#include "cookbook_file.h"
#include "tui.h"

namespace larder {

std::unique_ptr<cookbook> load_cookbook_or_throw(
    std::optional<std::filesystem::path> const &cookbook_path) {
  auto const path{ cookbook_file::find_path(cookbook_path) };
  auto book{ std::make_unique<cookbook>() };
  cookbook_file::load(path, *book);
  tui::debug("cookbook %s: %zu entries", path.string().c_str(), book->size());
  return book;
}

}  // namespace larder
