#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace concord::bitset {

/// Set of validator slot indices in [0, capacity).
///
/// Index i is bit i of the underlying word, so `value()` reads like a mask:
/// slots {0, 2} are 0b101.
class bitmask final {
 public:
  using word_t = uint32_t;
  static constexpr std::size_t capacity = 32;

  constexpr bitmask() = default;
  constexpr explicit bitmask(const word_t bits) : bits_{bits} {}

  /// Mask with the lowest `count` bits set. `count` must be <= capacity.
  static constexpr bitmask first_n(const std::size_t count) {
    if (count >= capacity) {
      return bitmask{~word_t{0}};
    }
    return bitmask{static_cast<word_t>((word_t{1} << count) - 1u)};
  }

  constexpr bitmask& set(const std::size_t index) {
    bits_ |= bit(index);
    return *this;
  }

  constexpr bitmask& clear(const std::size_t index) {
    bits_ &= static_cast<word_t>(~bit(index));
    return *this;
  }

  constexpr bool test(const std::size_t index) const {
    return (bits_ & bit(index)) != 0;
  }

  constexpr bool empty() const { return bits_ == 0; }

  constexpr std::size_t count() const {
    return static_cast<std::size_t>(std::popcount(bits_));
  }

  /// Every index in *this is also in `other`.
  constexpr bool is_subset_of(const bitmask other) const {
    return (bits_ & ~other.bits_) == 0;
  }

  /// Lowest index in the set. This is the tie-break used whenever one member
  /// has to stand for the whole set.
  constexpr std::optional<std::size_t> lowest() const {
    if (bits_ == 0) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(std::countr_zero(bits_));
  }

  constexpr word_t value() const { return bits_; }

  constexpr bool operator==(const bitmask&) const = default;

 private:
  static constexpr word_t bit(const std::size_t index) {
    return index < capacity ? static_cast<word_t>(word_t{1} << index)
                            : word_t{0};
  }

  word_t bits_{};
};

}  // namespace concord::bitset
