#include <spdlog/spdlog.h>
#include <strata/common/error.hpp>
#include <strata/engine/loader.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

using namespace strata::schema;

namespace {

strata::codec::options nested(const strata::codec::options& options) {
  auto out = options;
  ++out.depth;
  return out;
}

bool is_top_level(const strata::codec::options& options) {
  return options.depth == 0;
}

}  // namespace

namespace strata::engine {

loader::loader(strata::schema::registry& schemas)
    : loader(schemas, strata::codec::serializer_registry::make_default()) {}

loader::loader(strata::schema::registry& schemas,
               strata::codec::serializer_registry serializers)
    : schemas_(schemas), serializers_(std::move(serializers)) {}

bytes_t loader::serialize(const std::any& value,
                          const strata::codec::options& options) {
  auto out = strata::codec::writer{};
  serialize(value, out, options);
  return std::move(out.data);
}

void loader::serialize(const std::any& value,
                       strata::codec::writer& out,
                       const strata::codec::options& options) {
  if (!value.has_value()) {
    throw unregistered_type_error{"cannot serialize an empty value"};
  }
  const auto type = type_of(value);
  const auto& codec = resolve(type);
  if (!is_top_level(options)) {
    codec.encode(*this, value, out, nested(options));
    return;
  }

  const auto start = out.size();
  try {
    if (options.tagging) {
      out.write(tags().tag_of(type));
    }
    codec.encode(*this, value, out, nested(options));
  } catch (...) {
    out.data.resize(start);
    throw;
  }
}

std::any loader::deserialize(const bytes_view_t bytes,
                             std::optional<type_id_t> type,
                             const strata::codec::options& options) {
  auto in = strata::codec::reader{bytes};
  return deserialize(in, std::move(type), options);
}

std::any loader::deserialize(strata::codec::reader& in,
                             std::optional<type_id_t> type,
                             const strata::codec::options& options) {
  if (options.depth > config().max_depth) {
    throw malformed_stream_error{fmt::format(
        "value nesting exceeds the maximum depth of {}", config().max_depth)};
  }

  const auto start = in.position();
  try {
    if (options.tagging && is_top_level(options)) {
      const auto tagged = tags().type_of(in.read_u16());
      if (type && *type != tagged) {
        throw serialization_error{fmt::format(
            "stream is tagged as '{}' but '{}' was requested",
            schemas_.name_of(tagged), schemas_.name_of(*type))};
      }
      type = tagged;
    }
    if (!type) {
      throw std::invalid_argument{
          "a target type is required to decode an untagged stream"};
    }

    auto value = resolve(*type).decode(*this, *type, in, nested(options));
    if (type_of(value) != *type) {
      throw serialization_error{
          fmt::format("codec for '{}' produced a value of type '{}'",
                      schemas_.name_of(*type), type_of(value).name())};
    }
    return value;
  } catch (...) {
    if (is_top_level(options)) {
      in.rewind(start);
    }
    throw;
  }
}

void loader::serialize_element(const std::any& value,
                               strata::codec::writer& out,
                               const strata::codec::options& options) {
  if (!value.has_value()) {
    throw unregistered_type_error{"cannot serialize an empty element"};
  }
  const auto type = type_of(value);
  // Resolve first so unknown types never receive a tag.
  resolve(type);
  out.write(tags().tag_of(type));
  serialize(value, out, options);
}

std::any loader::deserialize_element(strata::codec::reader& in,
                                     const strata::codec::options& options) {
  const auto type = tags().type_of(in.read_u16());
  return deserialize(in, type, options);
}

void loader::register_serializer(const type_id_t& type,
                                 strata::codec::serializer_ptr serializer) {
  if (serializers_.contains(type)) {
    spdlog::debug("Replacing serializer for '{}'", schemas_.name_of(type));
  }
  serializers_.put(type, std::move(serializer));
}

const strata::codec::serializer& loader::resolve(const type_id_t& type) const {
  if (const auto* serializer = serializers_.find(type)) {
    return *serializer;
  }
  if (schemas_.contains(type)) {
    return object_serializer_;
  }
  if (schemas_.find_sequence(type) != nullptr) {
    return sequence_serializer_;
  }
  throw unregistered_type_error{
      fmt::format("no serializer or schema registered for '{}'",
                  schemas_.name_of(type))};
}

bool loader::can_resolve(const type_id_t& type) const {
  return serializers_.contains(type) || schemas_.contains(type) ||
         schemas_.find_sequence(type) != nullptr;
}

void loader::write(const std::filesystem::path& path,
                   const std::any& value,
                   const strata::codec::options& options) {
  auto bytes = serialize(value, options);

  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!output.good()) {
    spdlog::error("Failed opening output '{}'", path.string());
    throw file_access_error{"failed to open file for writing", path.string()};
  }
  output.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  output.flush();
  if (!output.good()) {
    spdlog::error("Failed writing output '{}'", path.string());
    throw file_access_error{"failed to write file", path.string()};
  }
  spdlog::info("Wrote {} byte(s) to '{}'", bytes.size(), path.string());
}

std::any loader::read(const std::filesystem::path& path,
                      std::optional<type_id_t> type,
                      const strata::codec::options& options) {
  auto error = std::error_code{};
  if (!std::filesystem::is_regular_file(path, error)) {
    spdlog::error("No readable file at '{}'", path.string());
    throw file_access_error{"path is not a regular file", path.string()};
  }

  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    spdlog::error("Failed opening input '{}'", path.string());
    throw file_access_error{"failed to open file for reading", path.string()};
  }
  auto bytes = bytes_t{std::istreambuf_iterator<char>{input},
                       std::istreambuf_iterator<char>{}};
  if (input.bad()) {
    spdlog::error("Failed reading input '{}'", path.string());
    throw file_access_error{"failed to read file", path.string()};
  }

  auto in = strata::codec::reader{make_bytes_view(bytes)};
  auto value = deserialize(in, std::move(type), options);
  if (!in.exhausted()) {
    throw malformed_stream_error{
        fmt::format("{} trailing byte(s) after the value in '{}'",
                    in.remaining(), path.string())};
  }
  spdlog::info("Read {} byte(s) from '{}'", bytes.size(), path.string());
  return value;
}

}  // namespace strata::engine
