#include <concord/schema/manager_error_code.hpp>
#include <concord/testing/manager_harness.hpp>
#include <concord/validator/manager.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace concord::schema;
using namespace concord::testing;
using concord::validator::manager;
using concord::validator::manager_config;

namespace {

void expect_code(const claim_response_t& response,
                 const manager_error_code code) {
  EXPECT_EQ(response.code, static_cast<uint32_t>(code)) << response.log;
}

claim_outcome_t no_conflict() {
  return claim_outcome_t{};
}

}  // namespace

TEST(manager, create_fills_goal_from_roster) {
  auto m = make_manager();
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b111u);
  EXPECT_TRUE(m.agreement_mask().empty());
  EXPECT_TRUE(is_zero(m.current_claim()));
  EXPECT_EQ(m.orchestrator(), kOrchestrator);
}

TEST(manager, create_rejects_zero_orchestrator_and_bad_roster) {
  auto error = std::string{};
  EXPECT_FALSE(manager::create(manager_config{.orchestrator = {},
                                              .validators = {kA, kB}},
                               error)
                   .has_value());
  EXPECT_NE(error.find("orchestrator"), std::string::npos);

  error.clear();
  EXPECT_FALSE(manager::create(manager_config{.orchestrator = kOrchestrator,
                                              .validators = {kA, kA}},
                               error)
                   .has_value());
  EXPECT_FALSE(error.empty());

  auto too_many = std::vector<validator_id_t>{};
  for (uint8_t i = 1; i <= manager::kMaxValidators + 1; ++i) {
    too_many.push_back(make_validator(i));
  }
  error.clear();
  EXPECT_FALSE(manager::create(manager_config{.orchestrator = kOrchestrator,
                                              .validators = too_many},
                               error)
                   .has_value());
  EXPECT_FALSE(error.empty());
}

TEST(manager, unanimous_claims_reach_consensus) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events);

  auto first = m.submit_claim(kOrchestrator, kA, kX);
  EXPECT_EQ(first.code, 0u);
  EXPECT_EQ(first.outcome, no_conflict());
  EXPECT_EQ(m.agreement_mask().value(), 0b001u);
  EXPECT_EQ(m.current_claim(), kX);

  auto second = m.submit_claim(kOrchestrator, kB, kX);
  EXPECT_EQ(second.outcome, no_conflict());
  EXPECT_EQ(m.agreement_mask().value(), 0b011u);

  auto third = m.submit_claim(kOrchestrator, kC, kX);
  EXPECT_EQ(third.outcome.result, claim_result_t::consensus);
  EXPECT_EQ(third.outcome.claims[0], kX);
  EXPECT_TRUE(is_zero(third.outcome.claims[1]));
  EXPECT_EQ(third.outcome.validators[0], kC);
  EXPECT_TRUE(is_zero(third.outcome.validators[1]));
  EXPECT_EQ(m.agreement_mask(), m.consensus_goal_mask());

  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[2].type, manager_event_type_t::claim_received);
  EXPECT_EQ(events[2].result, claim_result_t::consensus);
  EXPECT_EQ(events[2].claims, third.outcome.claims);
  EXPECT_EQ(events[2].validators, third.outcome.validators);
}

TEST(manager, single_validator_reaches_consensus_on_first_claim) {
  auto error = std::string{};
  auto m = manager::create(
      manager_config{.orchestrator = kOrchestrator, .validators = {kA}}, error);
  ASSERT_TRUE(m.has_value()) << error;

  auto response = m->submit_claim(kOrchestrator, kA, kX);
  EXPECT_EQ(response.outcome.result, claim_result_t::consensus);
  EXPECT_EQ(m->agreement_mask().value(), 0b1u);
}

TEST(manager, differing_claim_reports_conflict_against_lowest_endorser) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events);
  m.submit_claim(kOrchestrator, kB, kX);
  m.submit_claim(kOrchestrator, kC, kX);

  auto response = m.submit_claim(kOrchestrator, kA, kY);
  EXPECT_EQ(response.code, 0u);
  EXPECT_EQ(response.outcome.result, claim_result_t::conflict);
  EXPECT_EQ(response.outcome.claims[0], kX);
  EXPECT_EQ(response.outcome.claims[1], kY);
  EXPECT_EQ(response.outcome.validators[0], kB);
  EXPECT_EQ(response.outcome.validators[1], kA);

  // The standoff leaves the masks and claim untouched.
  EXPECT_EQ(m.agreement_mask().value(), 0b110u);
  EXPECT_EQ(m.current_claim(), kX);
  EXPECT_EQ(events.back().result, claim_result_t::conflict);
}

TEST(manager, resubmitting_current_claim_after_conflict_does_not_conflict) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  auto conflict = m.submit_claim(kOrchestrator, kB, kY);
  EXPECT_EQ(conflict.outcome.result, claim_result_t::conflict);

  auto again = m.submit_claim(kOrchestrator, kA, kX);
  EXPECT_EQ(again.outcome, no_conflict());
  auto joined = m.submit_claim(kOrchestrator, kB, kX);
  EXPECT_EQ(joined.outcome, no_conflict());
  EXPECT_EQ(m.agreement_mask().value(), 0b011u);
}

TEST(manager, dispute_won_by_endorser_keeps_claim) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events);
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);

  auto response = m.resolve_dispute(kOrchestrator, kA, kB, kX);
  EXPECT_EQ(response.code, 0u);
  EXPECT_EQ(response.outcome, no_conflict());
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b101u);
  EXPECT_EQ(m.agreement_mask().value(), 0b001u);
  EXPECT_EQ(m.current_claim(), kX);
  EXPECT_FALSE(m.roster().index_of(kB).has_value());
  EXPECT_EQ(events.back().type, manager_event_type_t::dispute_ended);

  auto last = m.submit_claim(kOrchestrator, kC, kX);
  EXPECT_EQ(last.outcome.result, claim_result_t::consensus);
  EXPECT_EQ(m.agreement_mask().value(), 0b101u);
}

TEST(manager, dispute_won_by_challenger_adopts_winning_claim) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);

  auto response = m.resolve_dispute(kOrchestrator, kB, kA, kY);
  EXPECT_EQ(response.code, 0u);
  EXPECT_EQ(response.outcome, no_conflict());
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b110u);
  EXPECT_EQ(m.agreement_mask().value(), 0b010u);
  EXPECT_EQ(m.current_claim(), kY);

  auto last = m.submit_claim(kOrchestrator, kC, kY);
  EXPECT_EQ(last.outcome.result, claim_result_t::consensus);
}

TEST(manager, dispute_continues_against_remaining_endorser) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kX);
  m.submit_claim(kOrchestrator, kC, kY);

  auto response = m.resolve_dispute(kOrchestrator, kC, kA, kY);
  EXPECT_EQ(response.outcome.result, claim_result_t::conflict);
  EXPECT_EQ(response.outcome.claims[0], kX);
  EXPECT_EQ(response.outcome.claims[1], kY);
  EXPECT_EQ(response.outcome.validators[0], kB);
  EXPECT_EQ(response.outcome.validators[1], kC);
  EXPECT_EQ(m.current_claim(), kX);
  EXPECT_EQ(m.agreement_mask().value(), 0b010u);
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b110u);

  auto final_round = m.resolve_dispute(kOrchestrator, kC, kB, kY);
  EXPECT_EQ(final_round.outcome.result, claim_result_t::consensus);
  EXPECT_EQ(final_round.outcome.claims[0], kY);
  EXPECT_EQ(final_round.outcome.validators[0], kC);
  EXPECT_EQ(m.current_claim(), kY);
  EXPECT_EQ(m.agreement_mask().value(), 0b100u);
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b100u);
}

TEST(manager, removal_reaching_goal_reports_consensus) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kX);

  auto response = m.resolve_dispute(kOrchestrator, kA, kC, kX);
  EXPECT_EQ(response.outcome.result, claim_result_t::consensus);
  EXPECT_EQ(response.outcome.validators[0], kA);
  EXPECT_EQ(m.agreement_mask(), m.consensus_goal_mask());
}

TEST(manager, removal_clears_exactly_one_bit) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kX);
  m.submit_claim(kOrchestrator, kC, kZ);

  auto goal_before = m.consensus_goal_mask();
  auto agreement_before = m.agreement_mask();
  m.resolve_dispute(kOrchestrator, kA, kC, kX);

  EXPECT_EQ(goal_before.value() ^ m.consensus_goal_mask().value(), 0b100u);
  EXPECT_EQ(agreement_before, m.agreement_mask());

  m.resolve_dispute(kOrchestrator, kA, kB, kX);
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b001u);
  EXPECT_EQ(m.agreement_mask().value(), 0b001u);
  EXPECT_EQ(m.roster().at(0), kA);
  EXPECT_EQ(m.roster().size(), 3u);
}

TEST(manager, advance_epoch_resets_claim_and_agreement_only) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events);
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);
  m.resolve_dispute(kOrchestrator, kA, kB, kX);

  auto response = m.advance_epoch(kOrchestrator);
  EXPECT_EQ(response.code, 0u);
  EXPECT_EQ(response.finalized_claim, kX);
  EXPECT_TRUE(m.agreement_mask().empty());
  EXPECT_TRUE(is_zero(m.current_claim()));
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b101u);

  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().type, manager_event_type_t::new_epoch);
  EXPECT_FALSE(events.back().result.has_value());
  EXPECT_EQ(events.back().claims[0], kX);

  auto next = m.submit_claim(kOrchestrator, kC, kZ);
  EXPECT_EQ(next.outcome, no_conflict());
  EXPECT_EQ(m.current_claim(), kZ);
  EXPECT_EQ(m.agreement_mask().value(), 0b100u);
}

TEST(manager, advance_epoch_without_claim_returns_zero) {
  auto m = make_manager();
  auto response = m.advance_epoch(kOrchestrator);
  EXPECT_EQ(response.code, 0u);
  EXPECT_TRUE(is_zero(response.finalized_claim));
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b111u);
}

TEST(manager, rejected_calls_change_nothing) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events);
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);
  events.clear();
  const auto before = m.snapshot();
  const auto stranger = make_validator(0x77);

  expect_code(m.submit_claim(kA, kA, kX),
              manager_error_code::authorization_denied);
  expect_code(m.submit_claim(kOrchestrator, kA, claim_t{}),
              manager_error_code::invalid_claim);
  expect_code(m.submit_claim(kOrchestrator, stranger, kX),
              manager_error_code::unknown_validator);

  expect_code(m.resolve_dispute(kB, kA, kB, kX),
              manager_error_code::authorization_denied);
  expect_code(m.resolve_dispute(kOrchestrator, kA, kB, claim_t{}),
              manager_error_code::invalid_claim);
  expect_code(m.resolve_dispute(kOrchestrator, kA, kA, kX),
              manager_error_code::invalid_dispute_outcome);
  expect_code(m.resolve_dispute(kOrchestrator, stranger, kB, kX),
              manager_error_code::unknown_validator);

  auto epoch = m.advance_epoch(kC);
  EXPECT_EQ(epoch.code,
            static_cast<uint32_t>(manager_error_code::authorization_denied));
  EXPECT_TRUE(is_zero(epoch.finalized_claim));

  EXPECT_EQ(m.snapshot(), before);
  EXPECT_TRUE(events.empty());
}

// A dispute won by a validator that never endorsed the current claim, against
// its only endorser, keeps the claim but empties the agreement. A later
// conflicting claim then has nobody to be reported against.
TEST(manager, conflict_without_endorser_is_rejected) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events);
  m.submit_claim(kOrchestrator, kA, kX);
  auto dispute = m.resolve_dispute(kOrchestrator, kC, kA, kX);
  ASSERT_EQ(dispute.code, 0u);
  ASSERT_TRUE(m.agreement_mask().empty());
  ASSERT_EQ(m.current_claim(), kX);
  events.clear();
  const auto before = m.snapshot();

  auto response = m.submit_claim(kOrchestrator, kB, kY);
  expect_code(response, manager_error_code::invariant_violation);
  EXPECT_EQ(response.codespace, "concord.submit_claim");
  EXPECT_EQ(response.outcome, no_conflict());
  EXPECT_EQ(m.snapshot(), before);
  EXPECT_TRUE(events.empty());
}

TEST(manager, matching_claim_after_empty_agreement_recovers) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  m.resolve_dispute(kOrchestrator, kC, kA, kX);
  expect_code(m.submit_claim(kOrchestrator, kB, kY),
              manager_error_code::invariant_violation);

  auto response = m.submit_claim(kOrchestrator, kB, kX);
  EXPECT_EQ(response.code, 0u);
  EXPECT_EQ(response.outcome, no_conflict());
  EXPECT_EQ(m.agreement_mask().value(), 0b010u);
  EXPECT_EQ(m.current_claim(), kX);
}

TEST(manager, rejection_carries_codespace_and_reason) {
  auto m = make_manager();
  auto response = m.submit_claim(kOrchestrator, kA, claim_t{});
  EXPECT_EQ(response.codespace, "concord.submit_claim");
  EXPECT_FALSE(response.log.empty());
  EXPECT_EQ(response.outcome, no_conflict());

  auto epoch = m.advance_epoch(kA);
  EXPECT_EQ(epoch.codespace, "concord.advance_epoch");
}

TEST(manager, unknown_loser_is_skipped_by_default) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events);
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);
  m.resolve_dispute(kOrchestrator, kA, kB, kX);
  events.clear();

  // B already lost once; recording the outcome again still evaluates it.
  auto response = m.resolve_dispute(kOrchestrator, kA, kB, kX);
  EXPECT_EQ(response.code, 0u);
  EXPECT_EQ(response.outcome, no_conflict());
  EXPECT_EQ(m.consensus_goal_mask().value(), 0b101u);
  EXPECT_EQ(events.size(), 1u);
}

TEST(manager, unknown_loser_is_rejected_when_configured) {
  auto events = std::vector<manager_event_t>{};
  auto m = make_observed_manager(events, unknown_loser_policy::reject);
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);
  m.resolve_dispute(kOrchestrator, kA, kB, kX);
  events.clear();
  const auto before = m.snapshot();

  expect_code(m.resolve_dispute(kOrchestrator, kA, kB, kX),
              manager_error_code::unknown_validator);
  EXPECT_EQ(m.snapshot(), before);
  EXPECT_TRUE(events.empty());
}

TEST(manager, removed_validator_can_no_longer_submit) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);
  m.resolve_dispute(kOrchestrator, kA, kB, kX);

  expect_code(m.submit_claim(kOrchestrator, kB, kX),
              manager_error_code::unknown_validator);
  expect_code(m.resolve_dispute(kOrchestrator, kB, kC, kX),
              manager_error_code::unknown_validator);
}

TEST(manager, snapshot_restores_identical_manager) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  m.submit_claim(kOrchestrator, kB, kY);
  m.resolve_dispute(kOrchestrator, kA, kB, kX);

  auto error = std::string{};
  auto restored =
      manager::restore(m.snapshot(), unknown_loser_policy::skip, error);
  ASSERT_TRUE(restored.has_value()) << error;
  EXPECT_EQ(restored->snapshot(), m.snapshot());
  EXPECT_FALSE(restored->roster().index_of(kB).has_value());

  auto response = restored->submit_claim(kOrchestrator, kC, kX);
  EXPECT_EQ(response.outcome.result, claim_result_t::consensus);
}

TEST(manager, restore_rejects_inconsistent_snapshots) {
  auto m = make_manager();
  m.submit_claim(kOrchestrator, kA, kX);
  const auto good = m.snapshot();
  auto error = std::string{};

  auto wrong_goal = good;
  wrong_goal.consensus_goal = 0b011u;
  EXPECT_FALSE(
      manager::restore(wrong_goal, unknown_loser_policy::skip, error));
  EXPECT_FALSE(error.empty());

  auto stray_agreement = good;
  stray_agreement.agreement = 0b1000u;
  error.clear();
  EXPECT_FALSE(
      manager::restore(stray_agreement, unknown_loser_policy::skip, error));
  EXPECT_FALSE(error.empty());

  auto claimless = good;
  claimless.current_claim = claim_t{};
  error.clear();
  EXPECT_FALSE(
      manager::restore(claimless, unknown_loser_policy::skip, error));
  EXPECT_FALSE(error.empty());
}

TEST(manager, arrival_order_decides_baseline_claim) {
  auto first = make_manager();
  first.submit_claim(kOrchestrator, kA, kX);
  auto conflict_x = first.submit_claim(kOrchestrator, kB, kY);

  auto second = make_manager();
  second.submit_claim(kOrchestrator, kB, kY);
  auto conflict_y = second.submit_claim(kOrchestrator, kA, kX);

  EXPECT_EQ(first.current_claim(), kX);
  EXPECT_EQ(second.current_claim(), kY);
  EXPECT_EQ(conflict_x.outcome.validators[0], kA);
  EXPECT_EQ(conflict_y.outcome.validators[0], kB);
}
