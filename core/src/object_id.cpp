#include "arbor/object_id.hpp"

namespace arbor {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<ObjectId> ObjectId::from_string(std::string_view name) noexcept {
  if (name.size() != OBJECT_ID_STRING_LENGTH)
    return std::nullopt;

  Raw raw{};
  for (size_t i = 0; i < OBJECT_ID_LENGTH; ++i) {
    int hi = hex_value(name[2 * i]);
    int lo = hex_value(name[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    raw[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return ObjectId(raw);
}

const ObjectId &ObjectId::zero() noexcept {
  static const ObjectId z;
  return z;
}

std::string ObjectId::name() const {
  std::string out(OBJECT_ID_STRING_LENGTH, '0');
  for (size_t i = 0; i < OBJECT_ID_LENGTH; ++i) {
    out[2 * i] = HEX_DIGITS[raw_[i] >> 4];
    out[2 * i + 1] = HEX_DIGITS[raw_[i] & 0x0f];
  }
  return out;
}

} // namespace arbor
