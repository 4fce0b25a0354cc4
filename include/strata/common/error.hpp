#pragma once

#include <csignal>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace strata {

/// Root of every error raised by the engine.
class error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Bad data: a value could not be encoded or a stream could not be decoded.
class serialization_error : public error {
 public:
  using error::error;
};

/// A type has no class definition.
class schema_not_found_error final : public serialization_error {
 public:
  using serialization_error::serialization_error;
};

/// No codec, class definition or sequence definition resolves for a type.
class unregistered_type_error final : public serialization_error {
 public:
  using serialization_error::serialization_error;
};

/// A tag read from a stream is not bound to any type.
class unknown_type_tag_error final : public serialization_error {
 public:
  unknown_type_tag_error(std::string message, uint16_t tag)
      : serialization_error(std::move(message)), tag_(tag) {}

  uint16_t tag() const noexcept { return tag_; }

 private:
  uint16_t tag_{};
};

/// Truncated input, out of range lengths, unknown field tokens, bad UTF-8.
class malformed_stream_error final : public serialization_error {
 public:
  using serialization_error::serialization_error;
};

/// Registry mutation rejected at registration time.
class registration_error : public error {
 public:
  using error::error;
};

/// An explicit identifier is already bound to a different key.
class conflict_error : public registration_error {
 public:
  using registration_error::registration_error;
};

class field_alias_conflict_error final : public conflict_error {
 public:
  using conflict_error::conflict_error;
};

class type_tag_conflict_error final : public conflict_error {
 public:
  using conflict_error::conflict_error;
};

/// Bad storage: the file layer failed, independent of the bytes themselves.
class file_access_error final : public error {
 public:
  file_access_error(std::string message, std::string path)
      : error(std::move(message)), path_(std::move(path)) {}

  const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
};

}  // namespace strata

namespace strata::common {

/// Broken internal invariant. Logs and terminates; never used for bad input.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace strata::common
