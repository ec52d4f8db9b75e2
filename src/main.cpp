#include "common/config.h"
#include "common/errors.h"
#include "common/logging.h"
#include "common/types.h"
#include "svm/account_record.h"
#include "svm/dispatcher.h"
#include "svm/instruction_codec.h"
#include "validation/account.h"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace solcore;

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [options] <command> [args]"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  decode HEX                 Decode instruction data"
            << std::endl;
  std::cout << "  encode OPCODE [FIELD...]   Encode an instruction from its "
               "opcode and u32 fields"
            << std::endl;
  std::cout << "  dispatch HEX               Decode and route instruction data"
            << std::endl;
  std::cout << "  account HEX                Parse an account record and show "
               "its rent status"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config FILE              Path to JSON configuration file"
            << std::endl;
  std::cout << "  --log-level LEVEL          Log level (trace, debug, info, "
               "warn, error)"
            << std::endl;
  std::cout << "  --json-logs                Emit logs as JSON lines"
            << std::endl;
  std::cout << "  --transfer-policy POLICY   Short Transfer payloads: reject "
               "(default) or report"
            << std::endl;
  std::cout << "  --help                     Show this help message"
            << std::endl;
}

namespace {

struct CliOptions {
  common::CoreConfig config;
  std::vector<std::string> positional;
  bool show_help = false;
};

common::Result<CliOptions> parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  std::string config_path;
  std::string log_level_override;
  std::string policy_override;
  bool json_logs_override = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--json-logs") {
      json_logs_override = true;
    } else if (arg == "--transfer-policy" && i + 1 < argc) {
      policy_override = argv[++i];
    } else if (arg.rfind("--", 0) == 0) {
      return common::Result<CliOptions>::failure("Unknown option: " + arg);
    } else {
      options.positional.push_back(arg);
    }
  }

  if (!config_path.empty()) {
    auto loaded = common::ConfigManager::load_from_file(config_path);
    if (loaded.is_err()) {
      return common::Result<CliOptions>::failure(loaded.error());
    }
    options.config = loaded.value();
  }

  // Command-line flags override the file
  nlohmann::json overrides = common::ConfigManager::to_json(options.config);
  if (!log_level_override.empty()) {
    overrides["log_level"] = log_level_override;
  }
  if (json_logs_override) {
    overrides["json_logs"] = true;
  }
  if (!policy_override.empty()) {
    overrides["truncated_transfer_policy"] = policy_override;
  }

  auto merged = common::ConfigManager::load_from_json(overrides);
  if (merged.is_err()) {
    return common::Result<CliOptions>::failure(merged.error());
  }
  options.config = merged.value();

  return common::Result<CliOptions>(std::move(options));
}

void print_instruction(const svm::Instruction &instruction) {
  svm::Opcode opcode = svm::opcode_of(instruction);
  std::cout << "Opcode: " << static_cast<int>(opcode) << " ("
            << svm::InstructionCodec::opcode_name(opcode) << ")" << std::endl;

  auto fields = svm::InstructionCodec::fields_of(instruction);
  for (size_t i = 0; i < fields.size(); ++i) {
    std::cout << "  Field " << i << ": " << fields[i] << std::endl;
  }
}

common::Result<common::Bytes> hex_argument(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    return common::Result<common::Bytes>("Missing HEX argument");
  }
  return common::from_hex(args[1]);
}

int run_decode(const std::vector<std::string> &args) {
  auto bytes = hex_argument(args);
  if (bytes.is_err()) {
    std::cerr << "Error: " << bytes.error() << std::endl;
    return 1;
  }

  auto decoded = svm::InstructionCodec::decode(bytes.value());
  if (decoded.is_err()) {
    std::cerr << "Error: " << decoded.error() << std::endl;
    return 1;
  }

  print_instruction(decoded.value());
  return 0;
}

int run_encode(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    std::cerr << "Error: Missing OPCODE argument" << std::endl;
    return 1;
  }

  std::vector<unsigned long> raw;
  for (size_t i = 1; i < args.size(); ++i) {
    char *end = nullptr;
    unsigned long value = std::strtoul(args[i].c_str(), &end, 10);
    if (end == args[i].c_str() || *end != '\0' || value > 0xFFFFFFFFUL) {
      std::cerr << "Error: Not a u32 value: " << args[i] << std::endl;
      return 1;
    }
    raw.push_back(value);
  }

  if (raw[0] > 0xFF) {
    std::cerr << "Error: Opcode must fit in one byte" << std::endl;
    return 1;
  }

  std::vector<uint32_t> fields(raw.begin() + 1, raw.end());
  auto encoded = svm::InstructionCodec::encode_fields(
      static_cast<uint8_t>(raw[0]), fields);
  if (encoded.is_err()) {
    std::cerr << "Error: " << encoded.error() << std::endl;
    return 1;
  }

  std::cout << common::to_hex(encoded.value()) << std::endl;
  return 0;
}

int run_dispatch(const std::vector<std::string> &args,
                 const common::CoreConfig &config) {
  auto bytes = hex_argument(args);
  if (bytes.is_err()) {
    std::cerr << "Error: " << bytes.error() << std::endl;
    return 1;
  }

  svm::Dispatcher dispatcher(config.truncated_transfer_policy);
  auto outcome = dispatcher.dispatch_raw(bytes.value());
  if (outcome.is_err()) {
    std::cerr << "Error: " << outcome.error() << std::endl;
    return 1;
  }

  const auto &result = outcome.value();
  std::cout << svm::to_string(result.kind)
            << (result.is_accepted() ? " accepted" : " skipped") << std::endl;
  std::cout << "  " << result.summary << std::endl;
  return 0;
}

int run_account(const std::vector<std::string> &args) {
  auto bytes = hex_argument(args);
  if (bytes.is_err()) {
    std::cerr << "Error: " << bytes.error() << std::endl;
    return 1;
  }

  auto parsed = svm::AccountRecordParser::parse(bytes.value());
  if (parsed.is_err()) {
    std::cerr << "Error: " << parsed.error() << std::endl;
    return 1;
  }

  const auto &record = parsed.value();
  std::cout << "Type: " << static_cast<int>(record.type_tag) << std::endl;
  std::cout << "Lamports: " << record.lamports << std::endl;
  std::cout << "Name (" << static_cast<int>(record.name_length)
            << " bytes): " << record.name << std::endl;

  auto account = svm::AccountRecordParser::to_account(record);
  if (account.is_err()) {
    std::cerr << "Error: " << account.error() << std::endl;
    return 1;
  }

  std::vector<std::unique_ptr<validation::Account>> accounts;
  accounts.push_back(std::move(account).value());
  validation::render_accounts(accounts, std::cout);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  auto parsed = parse_arguments(argc, argv);
  if (parsed.is_err()) {
    std::cerr << "Error: " << parsed.error() << std::endl;
    print_usage(argv[0]);
    return 1;
  }

  const auto &options = parsed.value();
  if (options.show_help || options.positional.empty()) {
    print_usage(argv[0]);
    return options.show_help ? 0 : 1;
  }

  common::ConfigManager::apply_logging(options.config);
  LOG_DEBUG("cli", "Transfer policy: ",
            common::to_string(options.config.truncated_transfer_policy));

  const std::string &command = options.positional[0];
  if (command == "decode") {
    return run_decode(options.positional);
  } else if (command == "encode") {
    return run_encode(options.positional);
  } else if (command == "dispatch") {
    return run_dispatch(options.positional, options.config);
  } else if (command == "account") {
    return run_account(options.positional);
  }

  std::cerr << "Error: Unknown command: " << command << std::endl;
  print_usage(argv[0]);
  return 1;
}
