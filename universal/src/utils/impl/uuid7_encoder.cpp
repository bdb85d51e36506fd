#include <utils/impl/uuid7_encoder.hpp>

#include <endian.h>
#include <cstring>

#include <utils/impl/uuid7_constants.hpp>

CHRONOID_NAMESPACE_BEGIN

namespace utils::generators::impl {

boost::uuids::uuid EncodeUuid7(std::uint64_t instant_ns,
                               std::uint64_t random_bits) noexcept {
  boost::uuids::uuid uuid{};

  const auto unix_ts_ms = instant_ns / kNanosecondsPerMillisecond;
  const auto sub_ms_ns = instant_ns % kNanosecondsPerMillisecond;
  const auto precision = static_cast<std::uint16_t>(
      sub_ms_ns * kRandAPrecision / kNanosecondsPerMillisecond);

  // fill unix_ts_ms
  const auto be_shifted_timestamp = htobe64(unix_ts_ms << 16ull);
  std::memcpy(&uuid.data[0], &be_shifted_timestamp, 6);

  // fill rand_a with sub-millisecond precision, top nibble goes to ver
  uuid.data[6] = static_cast<std::uint8_t>(precision >> 8);
  uuid.data[7] = static_cast<std::uint8_t>(precision);

  // fill var and rand_b with random data
  for (std::size_t i = 0; i < sizeof(random_bits); ++i) {
    uuid.data[8 + i] = static_cast<std::uint8_t>((random_bits >> (i * 8)) & 0xFF);
  }

  if constexpr (kStepBits == 10) {
    // only the top 10 bits of rand_a are meaningful, the lowest two take
    // random bits that the variant is about to overwrite
    uuid.data[7] ^= uuid.data[8] >> 6;
  }

  // fill ver (top four bits are 0, 1, 1, 1)
  uuid.data[6] = (uuid.data[6] & 0x0F) | 0x70;

  // fill var (top two bits are 1, 0)
  uuid.data[8] = (uuid.data[8] & 0x3F) | 0x80;

  return uuid;
}

}  // namespace utils::generators::impl

CHRONOID_NAMESPACE_END
