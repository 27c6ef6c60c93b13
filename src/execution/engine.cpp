#include <spdlog/spdlog.h>
#include <algorithm>
#include <concord/blake3/hash.hpp>
#include <concord/common/critical.hpp>
#include <concord/execution/engine.hpp>
#include <concord/schema/key/engine_keys.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace concord::schema;

namespace {

using encoder_t = concord::schema::encoding::encoder<
    concord::schema::encoding::scale_encoder_tag>;
using event_head_t = std::tuple<uint64_t, hash32_t>;

// Upper bound on the entries returned by one range query.
constexpr uint64_t kMaxRangeEntries = 1024;

bool roster_matches(const manager_state_t& state,
                    const concord::validator::manager_config& config) {
  if (state.orchestrator != config.orchestrator ||
      state.slots.size() != config.validators.size()) {
    return false;
  }
  for (std::size_t i = 0; i < state.slots.size(); ++i) {
    if (state.slots[i] && *state.slots[i] != config.validators[i]) {
      return false;
    }
  }
  return true;
}

std::pair<uint64_t, uint64_t> clamp_range(const uint64_t from,
                                          const uint64_t to,
                                          const uint64_t first,
                                          const uint64_t last) {
  auto begin = std::max(from, first);
  auto end = std::min(to, last);
  if (begin <= end && (end - begin) >= kMaxRangeEntries) {
    end = begin + kMaxRangeEntries - 1;
  }
  return {begin, end};
}

// Runs after the engine lock is released so the listener may call back in.
void notify(const concord::execution::event_listener_t& listener,
            const std::optional<event_record_t>& committed) {
  if (listener && committed) {
    listener(*committed);
  }
}

}  // namespace

namespace concord::execution {

engine::engine(encoder_t& encoder,
               concord::storage::storage<concord::storage::rocksdb_storage_tag>&
                   storage,
               const concord::validator::manager_config& config)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state(config);
  manager_->set_claim_listener(
      [this](const manager_event_t& event) { pending_event_ = event; });
  spdlog::info(
      "Execution engine ready at epoch {} with {} event(s), goal {:#x}",
      epoch_, last_event_id_, manager_->consensus_goal_mask().value());
}

claim_response_t engine::submit_claim(const validator_id_t& caller,
                                      const validator_id_t& validator,
                                      const claim_t& claim) {
  auto response = claim_response_t{};
  auto committed = std::optional<event_record_t>{};
  auto listener = event_listener_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    response = manager_->submit_claim(caller, validator, claim);
    if (response.code == 0) {
      committed = commit_event(std::nullopt);
      listener = listener_;
    }
  }
  notify(listener, committed);
  return response;
}

claim_response_t engine::resolve_dispute(const validator_id_t& caller,
                                         const validator_id_t& winner,
                                         const validator_id_t& loser,
                                         const claim_t& winning_claim) {
  auto response = claim_response_t{};
  auto committed = std::optional<event_record_t>{};
  auto listener = event_listener_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    response = manager_->resolve_dispute(caller, winner, loser, winning_claim);
    if (response.code == 0) {
      committed = commit_event(std::nullopt);
      listener = listener_;
    }
  }
  notify(listener, committed);
  return response;
}

epoch_response_t engine::advance_epoch(const validator_id_t& caller) {
  auto response = epoch_response_t{};
  auto committed = std::optional<event_record_t>{};
  auto listener = event_listener_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    response = manager_->advance_epoch(caller);
    if (response.code == 0) {
      response.epoch = epoch_;
      committed = commit_event(finalized_epoch_t{
          .epoch = epoch_, .claim = response.finalized_claim});
      listener = listener_;
      spdlog::info("Epoch {} finalized with claim {}", response.epoch,
                   to_hex(response.finalized_claim));
    }
  }
  notify(listener, committed);
  return response;
}

concord::bitset::bitmask engine::agreement_mask() const {
  auto lock = std::scoped_lock{mutex_};
  return manager_->agreement_mask();
}

concord::bitset::bitmask engine::consensus_goal_mask() const {
  auto lock = std::scoped_lock{mutex_};
  return manager_->consensus_goal_mask();
}

claim_t engine::current_claim() const {
  auto lock = std::scoped_lock{mutex_};
  return manager_->current_claim();
}

uint64_t engine::current_epoch() const {
  auto lock = std::scoped_lock{mutex_};
  return epoch_;
}

uint64_t engine::last_event_id() const {
  auto lock = std::scoped_lock{mutex_};
  return last_event_id_;
}

hash32_t engine::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  auto encoded = encoder_.encode(std::tuple{manager_->snapshot(), epoch_});
  return concord::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

manager_state_t engine::state() const {
  auto lock = std::scoped_lock{mutex_};
  return manager_->snapshot();
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<event_record_t>{};
  auto [begin, end] = clamp_range(from_id, to_id, 1, last_event_id_);
  for (auto id = begin; id <= end; ++id) {
    auto event_key = key::make_event_key(id);
    auto record = storage_.get<encoder_t, event_record_t>(
        encoder_, bytes_view_t{event_key.data(), event_key.size()});
    if (!record) {
      concord::common::critical("event log has a gap");
    }
    out.push_back(std::move(*record));
  }
  return out;
}

std::optional<finalized_epoch_t> engine::finalized_epoch(
    const uint64_t epoch) const {
  auto lock = std::scoped_lock{mutex_};
  if (epoch >= epoch_) {
    return std::nullopt;
  }
  auto record_key = key::make_finalized_epoch_key(epoch);
  return storage_.get<encoder_t, finalized_epoch_t>(
      encoder_, bytes_view_t{record_key.data(), record_key.size()});
}

std::vector<finalized_epoch_t> engine::history(const uint64_t from_epoch,
                                               const uint64_t to_epoch) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<finalized_epoch_t>{};
  if (epoch_ == 0) {
    return out;
  }
  auto [begin, end] = clamp_range(from_epoch, to_epoch, 0, epoch_ - 1);
  for (auto epoch = begin; epoch <= end; ++epoch) {
    auto record_key = key::make_finalized_epoch_key(epoch);
    auto record = storage_.get<encoder_t, finalized_epoch_t>(
        encoder_, bytes_view_t{record_key.data(), record_key.size()});
    if (!record) {
      concord::common::critical("finalized epoch record is missing");
    }
    out.push_back(*record);
  }
  return out;
}

void engine::set_event_listener(event_listener_t listener) {
  auto lock = std::scoped_lock{mutex_};
  listener_ = std::move(listener);
}

event_record_t engine::commit_event(
    std::optional<finalized_epoch_t> finalized) {
  if (!pending_event_) {
    concord::common::critical("manager accepted a call without an event");
  }

  auto record = event_record_t{};
  record.event_id = last_event_id_ + 1;
  record.epoch = epoch_;
  record.type = pending_event_->type;
  record.result = pending_event_->result;
  record.claims = pending_event_->claims;
  record.validators = pending_event_->validators;
  auto encoded_record = encoder_.encode(record);
  record.log_hash = concord::blake3::fold(
      last_log_hash_,
      bytes_view_t{encoded_record.data(), encoded_record.size()});

  auto entries = std::vector<concord::storage::key_value_entry_t>{};
  entries.emplace_back(key::make_key(key::kManagerStateKey),
                       encoder_.encode(manager_->snapshot()));
  entries.emplace_back(key::make_event_key(record.event_id),
                       encoder_.encode(record));
  entries.emplace_back(
      key::make_key(key::kEventHeadKey),
      encoder_.encode(event_head_t{record.event_id, record.log_hash}));
  if (finalized) {
    finalized->event_id = record.event_id;
    entries.emplace_back(key::make_finalized_epoch_key(finalized->epoch),
                         encoder_.encode(*finalized));
    entries.emplace_back(key::make_key(key::kEpochKey),
                         encoder_.encode(epoch_ + 1));
  }
  storage_.write_batch(entries);

  last_event_id_ = record.event_id;
  last_log_hash_ = record.log_hash;
  if (finalized) {
    ++epoch_;
  }
  pending_event_.reset();
  return record;
}

void engine::load_persisted_state(
    const concord::validator::manager_config& config) {
  auto state_key = key::make_key(key::kManagerStateKey);
  auto epoch_key = key::make_key(key::kEpochKey);
  auto head_key = key::make_key(key::kEventHeadKey);

  auto persisted = storage_.get<encoder_t, manager_state_t>(
      encoder_, bytes_view_t{state_key.data(), state_key.size()});
  auto error = std::string{};

  if (persisted) {
    manager_ = concord::validator::manager::restore(*persisted,
                                                    config.loser_policy, error);
    if (!manager_) {
      concord::common::critical("Persisted manager state is invalid: {}",
                                error);
    }
    if (!roster_matches(*persisted, config)) {
      spdlog::warn(
          "Configured roster differs from persisted roster; using persisted "
          "roster of {} slot(s)",
          persisted->slots.size());
    }
    epoch_ = storage_
                 .get<encoder_t, uint64_t>(
                     encoder_, bytes_view_t{epoch_key.data(), epoch_key.size()})
                 .value_or(0);
    auto head = storage_.get<encoder_t, event_head_t>(
        encoder_, bytes_view_t{head_key.data(), head_key.size()});
    if (head) {
      std::tie(last_event_id_, last_log_hash_) = *head;
    }
    spdlog::info("Restored validator manager at epoch {}, event {}", epoch_,
                 last_event_id_);
    return;
  }

  manager_ = concord::validator::manager::create(config, error);
  if (!manager_) {
    concord::common::critical("Invalid validator manager configuration: {}",
                              error);
  }
  auto entries = std::vector<concord::storage::key_value_entry_t>{};
  entries.emplace_back(std::move(state_key),
                       encoder_.encode(manager_->snapshot()));
  entries.emplace_back(std::move(epoch_key), encoder_.encode(uint64_t{0}));
  entries.emplace_back(std::move(head_key),
                       encoder_.encode(event_head_t{0, make_zero_hash()}));
  storage_.write_batch(entries);
  spdlog::info("Persisted genesis validator manager state");
}

}  // namespace concord::execution
