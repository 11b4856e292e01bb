#include <schemakit/EngineConfig.hpp>
#include <schemakit/Logger.hpp>
#include <schemakit/SchemaLoader.hpp>
#include <schemakit/ValueConversion.hpp>

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <yaml-cpp/yaml.h>

using namespace schemakit;

namespace {

void print_usage(const char *prog) {
  std::cerr << "Usage: " << prog
            << " <schema.yaml> <input.(json|yaml)> [options]\n\n";
  std::cerr << "Options:\n";
  std::cerr << "  --async                   Use the asynchronous engine\n";
  std::cerr << "  --config <path>           Engine config file (YAML)\n";
  std::cerr << "  --log-level <level>       trace|debug|info|warn|error|off\n";
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Value load_input(const std::string &path) {
  if (ends_with(path, ".json")) {
    std::ifstream in(path);
    if (!in)
      throw SchemaError("cannot open input file", path);
    return json_to_value(nlohmann::json::parse(in));
  }
  return yaml_to_value(YAML::LoadFile(path));
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 3) {
    print_usage(argv[0]);
    return 1;
  }

  std::string schema_path = argv[1];
  std::string input_path = argv[2];
  std::string config_path;
  std::string log_level;
  bool use_async = false;

  for (int i = 3; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--async") {
      use_async = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  std::optional<Result> result;
  try {
    EngineConfig config = config_path.empty()
                              ? EngineConfig::from_environment()
                              : EngineConfig::load_file(config_path);
    if (!log_level.empty())
      config.log_level = parse_log_level(log_level);
    SchemaLogger::instance().init(config.log_file, config.log_level);

    Schema schema = SchemaLoader::load_file(schema_path);
    Value input = load_input(input_path);
    SK_LOG_INFO("CLI", "VALIDATE", "validating '{}' against '{}' ({})",
                input_path, schema_path, use_async ? "async" : "sync");

    result = use_async
                 ? schema.validate_async(input, config.async_options()).get()
                 : schema.validate(input);
  } catch (const SchemaError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "Error: invalid JSON in " << input_path << ": " << e.what()
              << "\n";
    return 1;
  } catch (const YAML::Exception &e) {
    std::cerr << "Error: " << input_path << ": " << e.what() << "\n";
    return 1;
  }

  if (result->ok()) {
    std::cout << "Validation succeeded.\n";
    std::cout << value_to_json(result->value()).dump(2) << "\n";
    return 0;
  } else {
    std::cout << "Validation failed:\n";
    std::cout << format_issues(result->issues());
    return 2;
  }
}
