#include "auction/state.hh"
#include <algorithm>

namespace dutch {

std::vector<std::uint8_t> AuctionRecord::serialize() const {
    std::vector<std::uint8_t> result(SERIALIZED_SIZE);
    std::uint8_t* ptr = result.data();

    *ptr++ = initialized ? 1 : 0;

    std::copy(authority.begin(), authority.end(), ptr);
    ptr += ADDRESS_SIZE;

    std::copy(unit_id.begin(), unit_id.end(), ptr);
    ptr += ADDRESS_SIZE;

    encode_i64(ptr, time_start);
    ptr += sizeof(unix_timestamp_t);

    encode_i64(ptr, time_step);
    ptr += sizeof(unix_timestamp_t);

    encode_u64(ptr, price_start);
    ptr += sizeof(std::uint64_t);

    encode_u64(ptr, price_step);

    return result;
}

std::optional<AuctionRecord> AuctionRecord::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() != SERIALIZED_SIZE) {
        return std::nullopt;
    }

    AuctionRecord record;
    const std::uint8_t* ptr = data.data();

    switch (*ptr++) {
        case 0: record.initialized = false; break;
        case 1: record.initialized = true; break;
        default: return std::nullopt;
    }

    std::copy(ptr, ptr + ADDRESS_SIZE, record.authority.bytes.begin());
    ptr += ADDRESS_SIZE;

    std::copy(ptr, ptr + ADDRESS_SIZE, record.unit_id.bytes.begin());
    ptr += ADDRESS_SIZE;

    record.time_start = decode_i64(ptr);
    ptr += sizeof(unix_timestamp_t);

    record.time_step = decode_i64(ptr);
    ptr += sizeof(unix_timestamp_t);

    record.price_start = decode_u64(ptr);
    ptr += sizeof(std::uint64_t);

    record.price_step = decode_u64(ptr);

    return record;
}

}  // namespace dutch
