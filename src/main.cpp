#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <concord/config/config.hpp>
#include <concord/execution/engine.hpp>
#include <iostream>
#include <string>

using namespace concord::schema;

namespace {

using encoder_t = concord::schema::encoding::encoder<
    concord::schema::encoding::scale_encoder_tag>;

void setup_logging(const concord::config::options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.node.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "concord", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  auto level = spdlog::level::from_str(options.node.log_level);
  spdlog::set_level(options.verbose ? spdlog::level::debug : level);
}

std::string_view result_name(const std::optional<claim_result_t> result) {
  if (!result) {
    return "-";
  }
  return to_string_or(*result, kClaimResultNames, "unknown");
}

std::string_view event_type_name(const manager_event_type_t type) {
  return to_string_or(type, kManagerEventTypeNames, "unknown");
}

void print(const claim_response_t& response) {
  if (response.code != 0) {
    std::cout << fmt::format("error {} [{}]: {}\n", response.code,
                             response.codespace, response.log);
    return;
  }
  const auto& outcome = response.outcome;
  std::cout << fmt::format("{} claims=[{}, {}] validators=[{}, {}]\n",
                           result_name(outcome.result),
                           to_hex(outcome.claims[0]), to_hex(outcome.claims[1]),
                           to_hex(outcome.validators[0]),
                           to_hex(outcome.validators[1]));
}

void print(const event_record_t& event) {
  std::cout << fmt::format(
      "#{} epoch={} {} {} claims=[{}, {}] validators=[{}, {}] log={}\n",
      event.event_id, event.epoch, event_type_name(event.type),
      result_name(event.result), to_hex(event.claims[0]),
      to_hex(event.claims[1]), to_hex(event.validators[0]),
      to_hex(event.validators[1]), to_hex(event.log_hash));
}

bool require(const bool present, const std::string_view option) {
  if (!present) {
    std::cerr << "missing --" << option << "\n";
  }
  return present;
}

int run(concord::execution::engine& engine,
        const concord::config::options& options) {
  const auto& cmd = options.command;
  auto caller = cmd.caller.value_or(options.node.orchestrator);

  if (cmd.name == "status") {
    std::cout << fmt::format(
        "epoch={} claim={} agreement={:#010x} goal={:#010x} events={} "
        "state_root={}\n",
        engine.current_epoch(), to_hex(engine.current_claim()),
        engine.agreement_mask().value(), engine.consensus_goal_mask().value(),
        engine.last_event_id(), to_hex(engine.state_root()));
    return 0;
  }
  if (cmd.name == "submit-claim") {
    if (!require(cmd.sender.has_value(), "sender") ||
        !require(cmd.claim.has_value(), "claim")) {
      return 2;
    }
    auto response = engine.submit_claim(caller, *cmd.sender, *cmd.claim);
    print(response);
    return response.code == 0 ? 0 : 1;
  }
  if (cmd.name == "resolve-dispute") {
    if (!require(cmd.winner.has_value(), "winner") ||
        !require(cmd.loser.has_value(), "loser") ||
        !require(cmd.claim.has_value(), "claim")) {
      return 2;
    }
    auto response =
        engine.resolve_dispute(caller, *cmd.winner, *cmd.loser, *cmd.claim);
    print(response);
    return response.code == 0 ? 0 : 1;
  }
  if (cmd.name == "advance-epoch") {
    auto response = engine.advance_epoch(caller);
    if (response.code != 0) {
      std::cout << fmt::format("error {} [{}]: {}\n", response.code,
                               response.codespace, response.log);
      return 1;
    }
    std::cout << fmt::format("epoch {} finalized claim={}\n", response.epoch,
                             to_hex(response.finalized_claim));
    return 0;
  }
  if (cmd.name == "events") {
    for (const auto& event : engine.events(cmd.from, cmd.to)) {
      print(event);
    }
    return 0;
  }
  if (cmd.name == "history") {
    for (const auto& epoch : engine.history(cmd.from, cmd.to)) {
      std::cout << fmt::format("epoch {} claim={} event={}\n", epoch.epoch,
                               to_hex(epoch.claim), epoch.event_id);
    }
    return 0;
  }

  std::cerr << "unknown command '" << cmd.name << "'\n";
  return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = concord::config::parse(argc, argv, error);
  if (!options) {
    std::cerr << error << "\n";
    return 2;
  }
  if (options->help) {
    std::cout << options->usage << std::endl;
    return 0;
  }

  setup_logging(*options);

  auto encoder = encoder_t{};
  auto storage =
      concord::storage::make_storage<concord::storage::rocksdb_storage_tag>(
          options->node.db_path);
  auto engine = concord::execution::engine{
      encoder, storage, concord::config::make_manager_config(options->node)};

  auto code = run(engine, *options);

  spdlog::shutdown();
  return code;
}
