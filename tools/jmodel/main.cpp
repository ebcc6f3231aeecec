// jmodel - JSON model conversion command line interface
//
// Usage:
//   jmodel decode <input.json> --model <Name> [--config models.yaml]
//   jmodel roundtrip <input.json> --model <Name> [--config models.yaml] [-o output.json]
//   jmodel check <input.json> --model <Name> [--config models.yaml]
//
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "json_model/adapter/json_adapter.hpp"
#include "json_model/config/dynamic_model.hpp"
#include "json_model/config/model_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "JSON model converter v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <input.json> [options]\n\n"
            << "Commands:\n"
            << "  decode <input.json>      Decode a document and print the model values\n"
            << "  roundtrip <input.json>   Decode then encode a document\n"
            << "  check <input.json>       Check that a document decodes\n\n"
            << "Options:\n"
            << "  -m, --model <name>       Model type to decode as (required)\n"
            << "  -c, --config <path>      Model declarations (default: nearest models.yaml)\n"
            << "  -o, --output <path>      Output file (default: stdout)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_error(const json_model::Error & error)
{
  std::cerr << "error: " << error.describe() << "\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string model_name;
  std::string config_path;
  std::string output_path;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "-m" || arg == "--model") {
      if (i + 1 < argc) {
        args.model_name = argv[++i];
      }
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Shared Steps
// ============================================================================

/// Everything a command needs: the registry, the selected type and the input.
struct Session
{
  std::unique_ptr<json_model::ModelRegistry> registry;
  const json_model::ModelType * type = nullptr;
  nlohmann::json document;
};

bool open_session(const CommandArgs & args, Session & session)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input JSON file required\n";
    return false;
  }
  if (args.model_name.empty()) {
    std::cerr << "error: --model is required\n";
    return false;
  }

  fs::path config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else {
    auto found = json_model::find_model_config(fs::current_path());
    if (!found) {
      std::cerr << "error: no models.yaml found in current directory or parents\n";
      return false;
    }
    config_path = *found;
  }

  spdlog::debug("Loading model declarations from {}", config_path.string());
  const auto config_result = json_model::load_model_config(config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return false;
  }

  auto registry_result = json_model::ModelRegistry::from_config(config_result.config);
  if (!registry_result.success()) {
    std::cerr << "error: " << *registry_result.error << "\n";
    return false;
  }
  session.registry = std::move(*registry_result.value);

  session.type = session.registry->find(args.model_name);
  if (session.type == nullptr) {
    std::cerr << "error: unknown model '" << args.model_name << "'\n";
    return false;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  std::ifstream file(input_path);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return false;
  }

  try {
    session.document = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error & e) {
    std::cerr << "error: " << input_path.string() << ": " << e.what() << "\n";
    return false;
  }

  return true;
}

bool write_output(const CommandArgs & args, const nlohmann::json & out)
{
  if (args.output_path.empty()) {
    std::cout << out.dump(2) << "\n";
    return true;
  }

  std::ofstream file(args.output_path);
  if (!file.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return false;
  }
  file << out.dump(2) << "\n";
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_decode(const CommandArgs & args)
{
  Session session;
  if (!open_session(args, session)) {
    return 1;
  }

  auto decoded = json_model::JsonAdapter::model_of_type(*session.type, session.document);
  if (!decoded.success()) {
    print_error(*decoded.error);
    return 1;
  }

  const auto * model = dynamic_cast<const json_model::DynamicModel *>(decoded.value->get());
  if (model == nullptr) {
    std::cerr << "error: decoded model is not a declared model\n";
    return 1;
  }

  spdlog::debug("Decoded {} as {}", args.input_file, model->model_type().name());
  return write_output(args, model->to_display_json()) ? 0 : 1;
}

int cmd_roundtrip(const CommandArgs & args)
{
  Session session;
  if (!open_session(args, session)) {
    return 1;
  }

  auto decoded = json_model::JsonAdapter::model_of_type(*session.type, session.document);
  if (!decoded.success()) {
    print_error(*decoded.error);
    return 1;
  }

  auto encoded = json_model::JsonAdapter::json_from_model(**decoded.value);
  if (!encoded.success()) {
    print_error(*encoded.error);
    return 1;
  }

  if (args.verbose && *encoded.value != session.document) {
    std::cerr << "note: encoded document differs from the input\n";
  }

  return write_output(args, *encoded.value) ? 0 : 1;
}

int cmd_check(const CommandArgs & args)
{
  Session session;
  if (!open_session(args, session)) {
    return 1;
  }

  auto decoded = json_model::JsonAdapter::model_of_type(*session.type, session.document);
  if (!decoded.success()) {
    print_error(*decoded.error);
    return 1;
  }

  spdlog::debug("{} decodes as {}", args.input_file, (*decoded.value)->model_type().name());
  std::cout << args.input_file << ": OK\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  // Logs go to stderr; stdout carries the command output.
  spdlog::set_default_logger(spdlog::stderr_color_mt("jmodel"));
  spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

  if (args.command == "decode") {
    return cmd_decode(args);
  }
  if (args.command == "roundtrip") {
    return cmd_roundtrip(args);
  }
  if (args.command == "check") {
    return cmd_check(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n\n";
  print_usage(argv[0]);
  return 1;
}
