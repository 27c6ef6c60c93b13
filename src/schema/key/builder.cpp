#include <concord/schema/key/builder.hpp>
#include <iterator>

namespace concord::schema::key {

builder& builder::write(const std::string_view& str) {
  return write(concord::schema::make_bytes_view(str));
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  data.insert(std::end(data), std::begin(bytes), std::end(bytes));
  return *this;
}

}  // namespace concord::schema::key
