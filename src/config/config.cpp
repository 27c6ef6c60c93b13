#include <boost/program_options.hpp>
#include <spdlog/common.h>
#include <concord/config/config.hpp>
#include <exception>
#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace {

template <typename T>
std::optional<T> parse_hex_option(
    const po::variables_map& vm,
    const char* name,
    std::optional<T> (*parser)(const std::string_view&),
    std::string& error) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  auto raw = vm[name].as<std::string>();
  auto parsed = parser(raw);
  if (!parsed) {
    error = std::string{"invalid value for --"} + name + ": " + raw;
  }
  return parsed;
}

}  // namespace

namespace concord::config {

std::optional<options> parse(const int argc,
                             const char* const argv[],
                             std::string& error) {
  auto result = options{};
  auto config_path = std::string{};
  auto orchestrator = std::string{};
  auto validators = std::vector<std::string>{};
  auto policy = std::string{"skip"};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable debug logging")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with node settings");

  auto node = po::options_description{"Node"};
  node.add_options()(
      "db-path", po::value<std::string>(&result.node.db_path)
                     ->default_value(result.node.db_path),
      "RocksDB directory")(
      "orchestrator", po::value<std::string>(&orchestrator),
      "Identity allowed to call mutating commands (hex, 20 bytes)")(
      "validator", po::value<std::vector<std::string>>(&validators),
      "Validator identity in slot order (hex, 20 bytes, repeatable)")(
      "unknown-loser-policy", po::value<std::string>(&policy)->default_value(policy),
      "Dispute loser without a slot: skip or reject")(
      "log-level", po::value<std::string>(&result.node.log_level)
                       ->default_value(result.node.log_level),
      "spdlog level name")(
      "log-file", po::value<std::string>(&result.node.log_file)
                      ->default_value(result.node.log_file),
      "Log file path");

  auto command = po::options_description{"Command"};
  command.add_options()(
      "command", po::value<std::string>(&result.command.name)
                     ->default_value(result.command.name),
      "status, submit-claim, resolve-dispute, advance-epoch, events, history")(
      "caller", po::value<std::string>(),
      "Calling identity (defaults to the orchestrator)")(
      "sender", po::value<std::string>(), "Validator submitting a claim")(
      "claim", po::value<std::string>(), "Claim or winning claim (hex, 32 bytes)")(
      "winner", po::value<std::string>(), "Validator that won the dispute")(
      "loser", po::value<std::string>(), "Validator that lost the dispute")(
      "from", po::value<uint64_t>(&result.command.from)
                  ->default_value(result.command.from),
      "First event id or epoch of a range query")(
      "to", po::value<uint64_t>(&result.command.to)
                ->default_value(result.command.to),
      "Last event id or epoch of a range query");

  auto cli = po::options_description{"concord"};
  cli.add(generic).add(node).add(command);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, cli), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        error = "cannot open config file " + path;
        return std::nullopt;
      }
      po::store(po::parse_config_file(file, node), vm);
    }
    po::notify(vm);
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }

  if (vm.contains("help")) {
    auto out = std::ostringstream{};
    out << cli;
    result.help = true;
    result.usage = out.str();
    return result;
  }
  result.verbose = vm.contains("verbose");

  if (orchestrator.empty()) {
    error = "--orchestrator is required";
    return std::nullopt;
  }
  auto parsed_orchestrator = concord::schema::try_make_address(orchestrator);
  if (!parsed_orchestrator) {
    error = "invalid value for --orchestrator: " + orchestrator;
    return std::nullopt;
  }
  result.node.orchestrator = *parsed_orchestrator;

  if (validators.empty()) {
    error = "at least one --validator is required";
    return std::nullopt;
  }
  for (const auto& raw : validators) {
    auto id = concord::schema::try_make_address(raw);
    if (!id) {
      error = "invalid value for --validator: " + raw;
      return std::nullopt;
    }
    result.node.validators.push_back(*id);
  }

  auto parsed_policy =
      concord::schema::try_from_string<concord::schema::unknown_loser_policy>(
          policy);
  if (!parsed_policy) {
    error = "invalid value for --unknown-loser-policy: " + policy;
    return std::nullopt;
  }
  result.node.loser_policy = *parsed_policy;

  // spdlog maps unknown names to off; only "off" itself may mean that.
  if (spdlog::level::from_str(result.node.log_level) == spdlog::level::off &&
      result.node.log_level != "off") {
    error = "invalid value for --log-level: " + result.node.log_level;
    return std::nullopt;
  }

  auto& cmd = result.command;
  cmd.caller = parse_hex_option(vm, "caller",
                                &concord::schema::try_make_address, error);
  cmd.sender = parse_hex_option(vm, "sender",
                                &concord::schema::try_make_address, error);
  cmd.winner = parse_hex_option(vm, "winner",
                                &concord::schema::try_make_address, error);
  cmd.loser = parse_hex_option(vm, "loser",
                               &concord::schema::try_make_address, error);
  cmd.claim = parse_hex_option(vm, "claim",
                               &concord::schema::try_make_hash32, error);
  if (!error.empty()) {
    return std::nullopt;
  }
  return result;
}

concord::validator::manager_config make_manager_config(
    const node_config& config) {
  return concord::validator::manager_config{
      .orchestrator = config.orchestrator,
      .validators = config.validators,
      .loser_policy = config.loser_policy};
}

}  // namespace concord::config
