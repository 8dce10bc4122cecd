#pragma once

#include <filesystem>
#include <memory>
#include <optional>

namespace larder {

class cookbook;

// Locate (explicit path or upward discovery) and load a cookbook file into a fresh
// registry. Throws on a missing file, a script error or the first invalid entry.
std::unique_ptr<cookbook> load_cookbook_or_throw(
    std::optional<std::filesystem::path> const &cookbook_path);

}  // namespace larder
