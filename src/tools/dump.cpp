#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <strata/common/config.hpp>
#include <strata/common/error.hpp>
#include <strata/engine/loader.hpp>
#include <strata/format/render.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/schema/registry.hpp>
#include <strata/schema/type_tags.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

constexpr auto kExitFileError = 1;
constexpr auto kExitUsageError = 2;
constexpr auto kExitDataError = 3;

void configure_logging(const bool verbose) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("strata_dump", sink);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

strata::schema::bytes_t read_raw(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    throw strata::file_access_error{"failed to open file for reading", path};
  }
  return strata::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                 std::istreambuf_iterator<char>{}};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto input_path = std::string{};
  auto type_name = std::string{};
  auto max_depth = uint32_t{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"strata_dump"};
  description.add_options()("help,h", "Show the help message")(
      "input,i", po::value<std::string>(&input_path),
      "File written by the loader")(
      "type,t", po::value<std::string>(&type_name),
      "Built-in type of an untagged file: bool, int, float, str, list, tuple, "
      "set or map. Omit for tagged files")("hex", "Also print the raw bytes")(
      "max-depth", po::value<uint32_t>(&max_depth)->default_value(256),
      "Deepest nesting accepted while decoding")("verbose,v",
                                                 "Enable debug logging");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return kExitUsageError;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  configure_logging(vm.contains("verbose"));

  if (input_path.empty()) {
    spdlog::error("--input is required");
    return kExitUsageError;
  }

  auto type = std::optional<strata::schema::type_id_t>{};
  if (vm.contains("type")) {
    type = strata::schema::builtin_type(type_name);
    if (!type) {
      spdlog::error("Unknown built-in type '{}'", type_name);
      return kExitUsageError;
    }
  }

  auto config = strata::config{};
  config.max_depth = max_depth;
  auto tags = strata::schema::type_tags{config};
  auto schemas = strata::schema::registry{tags, config};
  auto loader = strata::engine::loader{schemas};

  try {
    if (vm.contains("hex")) {
      auto raw = read_raw(input_path);
      std::cout << "hex: "
                << strata::schema::to_hex(strata::schema::make_bytes_view(raw))
                << std::endl;
    }
    auto value = loader.read(input_path, type,
                             strata::codec::options{.tagging = !type});
    std::cout << strata::format::render(schemas, value) << std::endl;
  } catch (const strata::file_access_error& ex) {
    spdlog::error("{}: {}", ex.path(), ex.what());
    spdlog::shutdown();
    return kExitFileError;
  } catch (const strata::serialization_error& ex) {
    spdlog::error("Failed decoding '{}': {}", input_path, ex.what());
    spdlog::shutdown();
    return kExitDataError;
  }

  spdlog::shutdown();
  return 0;
}
