#pragma once

#include <concord/bitset/bitmask.hpp>
#include <concord/schema/claim_response.hpp>
#include <concord/schema/epoch_response.hpp>
#include <concord/schema/manager_event.hpp>
#include <concord/schema/manager_state.hpp>
#include <concord/schema/primitives.hpp>
#include <concord/schema/unknown_loser_policy.hpp>
#include <concord/validator/roster.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace concord::validator {

/// Receives one notification per successful mutating call, after the state
/// change has been applied.
using claim_listener_t =
    std::function<void(const concord::schema::manager_event_t& event)>;

/// Construction parameters of a manager.
struct manager_config final {
  concord::schema::validator_id_t orchestrator{};
  std::vector<concord::schema::validator_id_t> validators;
  concord::schema::unknown_loser_policy loser_policy{
      concord::schema::unknown_loser_policy::skip};
};

/// Claim agreement and dispute outcome bookkeeping for a fixed validator set.
///
/// Every validator holds a permanent slot; slot i is bit i of both masks.
/// The consensus goal is the set of occupied slots and only ever shrinks.
/// The agreement mask records who endorsed the current claim this epoch and
/// is always a subset of the goal. Consensus is reached when both masks are
/// equal.
///
/// Only the orchestrator fixed at construction may call the mutating entry
/// points. Each call validates everything before touching state, so a
/// rejected call leaves the manager exactly as it was and emits nothing.
class manager final {
 public:
  static constexpr auto kMaxValidators = concord::bitset::bitmask::capacity;

  /// Build a manager with every roster slot occupied and no claim.
  static std::optional<manager> create(const manager_config& config,
                                       std::string& error);

  /// Rebuild a manager from a persisted snapshot.
  ///
  /// Rejects snapshots whose masks, tombstones, and claim disagree.
  static std::optional<manager> restore(
      const concord::schema::manager_state_t& state,
      concord::schema::unknown_loser_policy loser_policy,
      std::string& error);

  /// Record `validator`'s claim for the current epoch.
  ///
  /// The first non-zero claim of an epoch becomes the current claim. A
  /// matching claim sets the sender's agreement bit; a different one yields
  /// a conflict against the lowest-index endorser without touching the masks.
  /// A different claim while nobody endorses the current one is rejected with
  /// `invariant_violation`.
  concord::schema::claim_response_t submit_claim(
      const concord::schema::validator_id_t& caller,
      const concord::schema::validator_id_t& validator,
      const concord::schema::claim_t& claim);

  /// Apply an externally decided dispute: evict `loser`, then either keep the
  /// current claim, continue the dispute against another endorser, or adopt
  /// `winning_claim` with `winner` as its first endorser.
  concord::schema::claim_response_t resolve_dispute(
      const concord::schema::validator_id_t& caller,
      const concord::schema::validator_id_t& winner,
      const concord::schema::validator_id_t& loser,
      const concord::schema::claim_t& winning_claim);

  /// Close the epoch: return the current claim and clear claim and agreement.
  /// The consensus goal carries over.
  concord::schema::epoch_response_t advance_epoch(
      const concord::schema::validator_id_t& caller);

  /// Validators that endorsed the current claim this epoch.
  concord::bitset::bitmask agreement_mask() const { return agreement_; }
  /// Occupied slots; consensus requires every one of them to agree.
  concord::bitset::bitmask consensus_goal_mask() const {
    return consensus_goal_;
  }
  /// Claim under agreement this epoch, zero until the first submission.
  const concord::schema::claim_t& current_claim() const {
    return current_claim_;
  }

  const concord::schema::validator_id_t& orchestrator() const {
    return orchestrator_;
  }
  const validator::roster& roster() const { return roster_; }

  /// Snapshot suitable for persistence and `restore`.
  concord::schema::manager_state_t snapshot() const;

  void set_claim_listener(claim_listener_t listener);

 private:
  manager(const concord::schema::validator_id_t& orchestrator,
          validator::roster roster,
          concord::schema::unknown_loser_policy loser_policy);

  bool authorized(const concord::schema::validator_id_t& caller) const;

  /// Lowest-index validator currently endorsing the current claim, or
  /// std::nullopt when the agreement mask is empty.
  std::optional<concord::schema::validator_id_t> first_endorser() const;

  /// Consensus when agreement equals the goal, otherwise no conflict.
  concord::schema::claim_outcome_t evaluate_agreement(
      const concord::schema::validator_id_t& reporter) const;

  void emit(concord::schema::manager_event_type_t type,
            const concord::schema::claim_outcome_t& outcome);

  concord::schema::validator_id_t orchestrator_;
  validator::roster roster_;
  concord::schema::unknown_loser_policy loser_policy_;
  concord::bitset::bitmask consensus_goal_;
  concord::bitset::bitmask agreement_;
  concord::schema::claim_t current_claim_{};
  claim_listener_t listener_;
};

}  // namespace concord::validator
