#include <concord/validator/roster.hpp>

#include <spdlog/fmt/fmt.h>

namespace concord::validator {

std::optional<roster> roster::create(
    const std::vector<concord::schema::validator_id_t>& validators,
    const std::size_t max_size,
    std::string& error) {
  auto slots = std::vector<slot_t>{};
  slots.reserve(validators.size());
  for (const auto& id : validators) {
    slots.emplace_back(id);
  }
  return restore(slots, max_size, error);
}

std::optional<roster> roster::restore(const std::vector<slot_t>& slots,
                                      const std::size_t max_size,
                                      std::string& error) {
  if (slots.empty()) {
    error = "validator roster is empty";
    return std::nullopt;
  }
  if (slots.size() > max_size) {
    error = fmt::format("validator roster has {} slots, at most {} allowed",
                        slots.size(), max_size);
    return std::nullopt;
  }

  auto result = roster{};
  result.slots_ = slots;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (!slots[i]) {
      continue;
    }
    if (concord::schema::is_zero(*slots[i])) {
      error = fmt::format("validator slot {} holds the zero address", i);
      return std::nullopt;
    }
    auto [it, inserted] = result.index_.emplace(*slots[i], i);
    if (!inserted) {
      error = fmt::format("validator {} appears in slots {} and {}",
                          concord::schema::to_hex(*slots[i]), it->second, i);
      return std::nullopt;
    }
  }
  return result;
}

std::optional<std::size_t> roster::index_of(
    const concord::schema::validator_id_t& id) const {
  auto it = index_.find(id);
  if (it == std::end(index_)) {
    return std::nullopt;
  }
  return it->second;
}

roster::slot_t roster::at(const std::size_t index) const {
  if (index >= slots_.size()) {
    return std::nullopt;
  }
  return slots_[index];
}

std::optional<std::size_t> roster::remove(
    const concord::schema::validator_id_t& id) {
  auto it = index_.find(id);
  if (it == std::end(index_)) {
    return std::nullopt;
  }
  auto index = it->second;
  slots_[index].reset();
  index_.erase(it);
  return index;
}

}  // namespace concord::validator
