#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <concord/common/critical.hpp>
#include <concord/schema/manager_error_code.hpp>
#include <concord/validator/manager.hpp>
#include <utility>

using namespace concord::schema;

namespace {

constexpr auto kSubmitClaimCodespace = std::string_view{"concord.submit_claim"};
constexpr auto kResolveDisputeCodespace =
    std::string_view{"concord.resolve_dispute"};
constexpr auto kAdvanceEpochCodespace =
    std::string_view{"concord.advance_epoch"};

template <typename Response>
Response& reject(Response& response,
                 const manager_error_code code,
                 const std::string_view log) {
  response.code = static_cast<uint32_t>(code);
  response.log = std::string{log};
  spdlog::warn("{} rejected (code {}): {}", response.codespace, response.code,
               response.log);
  return response;
}

std::string_view result_name(const claim_result_t result) {
  return to_string_or(result, kClaimResultNames, "unknown");
}

}  // namespace

namespace concord::validator {

manager::manager(const validator_id_t& orchestrator,
                 validator::roster roster,
                 const unknown_loser_policy loser_policy)
    : orchestrator_{orchestrator},
      roster_{std::move(roster)},
      loser_policy_{loser_policy} {}

std::optional<manager> manager::create(const manager_config& config,
                                       std::string& error) {
  if (is_zero(config.orchestrator)) {
    error = "orchestrator must not be the zero address";
    return std::nullopt;
  }
  auto slots = validator::roster::create(config.validators, kMaxValidators,
                                         error);
  if (!slots) {
    return std::nullopt;
  }

  auto result = manager{config.orchestrator, std::move(*slots),
                        config.loser_policy};
  result.consensus_goal_ =
      concord::bitset::bitmask::first_n(result.roster_.size());
  spdlog::info("Validator manager created with {} validator(s), goal {:#x}",
               result.roster_.size(), result.consensus_goal_.value());
  return result;
}

std::optional<manager> manager::restore(const manager_state_t& state,
                                        const unknown_loser_policy loser_policy,
                                        std::string& error) {
  if (is_zero(state.orchestrator)) {
    error = "orchestrator must not be the zero address";
    return std::nullopt;
  }
  auto slots = validator::roster::restore(state.slots, kMaxValidators, error);
  if (!slots) {
    return std::nullopt;
  }

  auto occupied = concord::bitset::bitmask{};
  for (std::size_t i = 0; i < slots->size(); ++i) {
    if (slots->at(i)) {
      occupied.set(i);
    }
  }

  auto goal = concord::bitset::bitmask{state.consensus_goal};
  auto agreement = concord::bitset::bitmask{state.agreement};
  if (goal != occupied) {
    error = fmt::format("consensus goal {:#x} does not match occupied slots {:#x}",
                        goal.value(), occupied.value());
    return std::nullopt;
  }
  if (!agreement.is_subset_of(goal)) {
    error = fmt::format("agreement {:#x} is not a subset of goal {:#x}",
                        agreement.value(), goal.value());
    return std::nullopt;
  }
  if (!agreement.empty() && is_zero(state.current_claim)) {
    error = "agreement recorded without a current claim";
    return std::nullopt;
  }

  auto result = manager{state.orchestrator, std::move(*slots), loser_policy};
  result.consensus_goal_ = goal;
  result.agreement_ = agreement;
  result.current_claim_ = state.current_claim;
  return result;
}

claim_response_t manager::submit_claim(const validator_id_t& caller,
                                       const validator_id_t& validator,
                                       const claim_t& claim) {
  auto response = claim_response_t{};
  response.codespace = std::string{kSubmitClaimCodespace};

  if (!authorized(caller)) {
    return reject(response, manager_error_code::authorization_denied,
                  "caller is not the orchestrator");
  }
  if (is_zero(claim)) {
    return reject(response, manager_error_code::invalid_claim,
                  "claim must not be empty");
  }
  auto index = roster_.index_of(validator);
  if (!index) {
    return reject(response, manager_error_code::unknown_validator,
                  "sender " + to_hex(validator) + " is not a validator");
  }

  if (is_zero(current_claim_)) {
    current_claim_ = claim;
  }

  if (claim != current_claim_) {
    auto endorser = first_endorser();
    if (!endorser) {
      return reject(response, manager_error_code::invariant_violation,
                    "conflicting claim " + to_hex(claim) +
                        " but nobody endorses the current claim " +
                        to_hex(current_claim_));
    }
    response.outcome = claim_outcome_t{
        .result = claim_result_t::conflict,
        .claims = {current_claim_, claim},
        .validators = {*endorser, validator}};
  } else {
    agreement_.set(*index);
    response.outcome = evaluate_agreement(validator);
  }

  spdlog::debug("Claim {} from validator {} (slot {}): {}, agreement {:#x}",
                to_hex(claim), to_hex(validator), *index,
                result_name(response.outcome.result), agreement_.value());
  emit(manager_event_type_t::claim_received, response.outcome);
  return response;
}

claim_response_t manager::resolve_dispute(const validator_id_t& caller,
                                          const validator_id_t& winner,
                                          const validator_id_t& loser,
                                          const claim_t& winning_claim) {
  auto response = claim_response_t{};
  response.codespace = std::string{kResolveDisputeCodespace};

  if (!authorized(caller)) {
    return reject(response, manager_error_code::authorization_denied,
                  "caller is not the orchestrator");
  }
  if (is_zero(winning_claim)) {
    return reject(response, manager_error_code::invalid_claim,
                  "winning claim must not be empty");
  }
  if (winner == loser) {
    return reject(response, manager_error_code::invalid_dispute_outcome,
                  "winner and loser are the same validator");
  }
  auto winner_index = roster_.index_of(winner);
  if (!winner_index) {
    return reject(response, manager_error_code::unknown_validator,
                  "winner " + to_hex(winner) + " is not a validator");
  }
  auto loser_index = roster_.index_of(loser);
  if (!loser_index && loser_policy_ == unknown_loser_policy::reject) {
    return reject(response, manager_error_code::unknown_validator,
                  "loser " + to_hex(loser) + " is not a validator");
  }

  if (loser_index) {
    roster_.remove(loser);
    agreement_.clear(*loser_index);
    consensus_goal_.clear(*loser_index);
    spdlog::info("Validator {} removed from slot {}, goal now {:#x}",
                 to_hex(loser), *loser_index, consensus_goal_.value());
  } else {
    spdlog::info("Dispute loser {} holds no slot; removal skipped",
                 to_hex(loser));
  }

  if (winning_claim == current_claim_) {
    response.outcome = evaluate_agreement(winner);
  } else if (auto endorser = first_endorser()) {
    // Someone else still backs the losing claim; the dispute moves on to them.
    response.outcome = claim_outcome_t{
        .result = claim_result_t::conflict,
        .claims = {current_claim_, winning_claim},
        .validators = {*endorser, winner}};
  } else {
    current_claim_ = winning_claim;
    agreement_.set(*winner_index);
    response.outcome = evaluate_agreement(winner);
  }

  spdlog::debug("Dispute won by {} with claim {}: {}, agreement {:#x}",
                to_hex(winner), to_hex(winning_claim),
                result_name(response.outcome.result), agreement_.value());
  emit(manager_event_type_t::dispute_ended, response.outcome);
  return response;
}

epoch_response_t manager::advance_epoch(const validator_id_t& caller) {
  auto response = epoch_response_t{};
  response.codespace = std::string{kAdvanceEpochCodespace};

  if (!authorized(caller)) {
    return reject(response, manager_error_code::authorization_denied,
                  "caller is not the orchestrator");
  }

  response.finalized_claim = current_claim_;
  current_claim_ = make_zero_hash();
  agreement_ = concord::bitset::bitmask{};

  spdlog::debug("Epoch closed with claim {}", to_hex(response.finalized_claim));
  emit(manager_event_type_t::new_epoch,
       claim_outcome_t{.result = claim_result_t::no_conflict,
                       .claims = {response.finalized_claim, claim_t{}},
                       .validators = {}});
  return response;
}

manager_state_t manager::snapshot() const {
  auto state = manager_state_t{};
  state.orchestrator = orchestrator_;
  state.slots = roster_.slots();
  state.consensus_goal = consensus_goal_.value();
  state.agreement = agreement_.value();
  state.current_claim = current_claim_;
  return state;
}

void manager::set_claim_listener(claim_listener_t listener) {
  listener_ = std::move(listener);
}

bool manager::authorized(const validator_id_t& caller) const {
  return caller == orchestrator_;
}

std::optional<validator_id_t> manager::first_endorser() const {
  auto index = agreement_.lowest();
  if (!index) {
    return std::nullopt;
  }
  auto id = roster_.at(*index);
  if (!id) {
    concord::common::critical("agreement mask references a vacated slot");
  }
  return id;
}

claim_outcome_t manager::evaluate_agreement(
    const validator_id_t& reporter) const {
  if (agreement_ == consensus_goal_) {
    return claim_outcome_t{.result = claim_result_t::consensus,
                           .claims = {current_claim_, claim_t{}},
                           .validators = {reporter, validator_id_t{}}};
  }
  return claim_outcome_t{};
}

void manager::emit(const manager_event_type_t type,
                   const claim_outcome_t& outcome) {
  if (!listener_) {
    return;
  }
  auto event = manager_event_t{.type = type,
                               .result = outcome.result,
                               .claims = outcome.claims,
                               .validators = outcome.validators};
  if (type == manager_event_type_t::new_epoch) {
    event.result.reset();
  }
  listener_(event);
}

}  // namespace concord::validator
