#include <blake3.h>
#include <concord/blake3/hash.hpp>

namespace concord::blake3 {

namespace {

// Owns one hasher for the duration of a single digest.
class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
    return *this;
  }

  concord::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<concord::schema::hash32_t>);
    auto output = concord::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

concord::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

concord::schema::hash32_t hash(const concord::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

concord::schema::hash32_t fold(const concord::schema::hash32_t& seed,
                               const concord::schema::bytes_view_t& bytes) {
  return hasher{}
      .update(seed.data(), seed.size())
      .update(bytes.data(), bytes.size())
      .finalize();
}

}  // namespace concord::blake3
