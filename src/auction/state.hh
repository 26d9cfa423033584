#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <vector>

namespace dutch {

// ============================================================================
// Auction Record
// ============================================================================

// Persisted state of one auction. Written once by InitializeAuction and never
// modified afterwards; the current price is derived from it and the clock.
struct AuctionRecord {
    bool initialized = false;
    Address authority;      // may withdraw once the auction finished
    Address unit_id;        // mint of the units being sold
    unix_timestamp_t time_start = 0;
    unix_timestamp_t time_step = 0;
    std::uint64_t price_start = 0;
    std::uint64_t price_step = 0;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    // Requires exactly SERIALIZED_SIZE bytes and an initialized flag of 0 or 1
    [[nodiscard]] static std::optional<AuctionRecord> deserialize(
        std::span<const std::uint8_t> data);

    static constexpr std::size_t SERIALIZED_SIZE =
        1 +                             // initialized
        ADDRESS_SIZE * 2 +              // authority, unit_id
        sizeof(unix_timestamp_t) * 2 +  // time_start, time_step
        sizeof(std::uint64_t) * 2;      // price_start, price_step

    bool operator==(const AuctionRecord&) const = default;
};

static_assert(AuctionRecord::SERIALIZED_SIZE == 97);

}  // namespace dutch
