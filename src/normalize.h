#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace larder {

// Canonicalize a free-form (handwritten) name into display form.
// Splits on runs of '-', '_' and ' ', strips every character that is not an ASCII
// letter from each token, title-cases the survivors and joins them with one space.
// Example: "Riz@z RISO00tto!" -> "Rizz Risotto", "meatball_-sandwich" -> "Meatball Sandwich"
// Returns nullopt when nothing survives (empty input, only separators/digits/symbols).
std::optional<std::string> normalize_name(std::string_view input);

// As normalize_name, but throws cookbook_error(INVALID_INPUT) instead of nullopt.
std::string normalize_name_or_throw(std::string_view input);

}  // namespace larder
