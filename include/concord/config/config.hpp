#pragma once

#include <concord/schema/primitives.hpp>
#include <concord/schema/unknown_loser_policy.hpp>
#include <concord/validator/manager.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace concord::config {

/// Settings shared by every invocation against one database.
struct node_config final {
  std::string db_path{"concord-db"};
  concord::schema::validator_id_t orchestrator{};
  std::vector<concord::schema::validator_id_t> validators;
  concord::schema::unknown_loser_policy loser_policy{
      concord::schema::unknown_loser_policy::skip};
  std::string log_level{"info"};
  std::string log_file{"concord.log"};
};

/// One command of the `concord` executable.
struct command_config final {
  std::string name{"status"};
  std::optional<concord::schema::validator_id_t> caller;
  std::optional<concord::schema::validator_id_t> sender;
  std::optional<concord::schema::claim_t> claim;
  std::optional<concord::schema::validator_id_t> winner;
  std::optional<concord::schema::validator_id_t> loser;
  uint64_t from{};
  uint64_t to{UINT64_MAX};
};

struct options final {
  node_config node;
  command_config command;
  bool help{false};
  bool verbose{false};
  // Rendered option descriptions, filled when `help` is set.
  std::string usage;
};

/// Parse command line arguments, then the INI file named by `--config` when
/// present. Command line values win over file values.
///
/// Returns std::nullopt and sets `error` on malformed input.
std::optional<options> parse(int argc, const char* const argv[],
                             std::string& error);

/// Manager construction parameters derived from the node settings.
concord::validator::manager_config make_manager_config(
    const node_config& config);

}  // namespace concord::config
