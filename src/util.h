#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace larder {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Append value to out with JSON string escaping (no surrounding quotes).
void util_append_json_escaped(std::string &out, std::string_view value);

// Quote and escape value as a JSON string literal.
std::string util_json_quote(std::string_view value);

// Signed 64-bit arithmetic; nullopt when the result is not representable.
std::optional<std::int64_t> util_checked_add(std::int64_t a, std::int64_t b);
std::optional<std::int64_t> util_checked_mul(std::int64_t a, std::int64_t b);

}  // namespace larder
