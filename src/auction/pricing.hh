#pragma once

#include "auction/state.hh"
#include <string_view>

namespace dutch {

// ============================================================================
// Price State
// ============================================================================

enum class PricePhase : std::uint8_t {
    NOT_STARTED = 0,
    ACTIVE = 1,
    FINISHED = 2,
};

[[nodiscard]] constexpr std::string_view price_phase_string(PricePhase phase) {
    switch (phase) {
        case PricePhase::NOT_STARTED: return "NOT_STARTED";
        case PricePhase::ACTIVE: return "ACTIVE";
        case PricePhase::FINISHED: return "FINISHED";
    }
    return "UNKNOWN";
}

// `price` is meaningful only while ACTIVE, and is then always nonzero
struct PriceState {
    PricePhase phase = PricePhase::NOT_STARTED;
    std::uint64_t price = 0;

    [[nodiscard]] static PriceState not_started() { return {PricePhase::NOT_STARTED, 0}; }
    [[nodiscard]] static PriceState active(std::uint64_t price) { return {PricePhase::ACTIVE, price}; }
    [[nodiscard]] static PriceState finished() { return {PricePhase::FINISHED, 0}; }

    [[nodiscard]] bool is_active() const { return phase == PricePhase::ACTIVE; }
    [[nodiscard]] bool is_finished() const { return phase == PricePhase::FINISHED; }

    bool operator==(const PriceState&) const = default;
};

// ============================================================================
// Price Decay
// ============================================================================

// price = price_start - price_step * floor((now - time_start) / time_step)
//
// NOT_STARTED before time_start. FINISHED once the price reaches zero or
// would go below it (including overflow of price_step * steps). A record with
// time_step <= 0 violates its invariant and is reported FINISHED.
[[nodiscard]] PriceState current_price(const AuctionRecord& record, unix_timestamp_t now);

}  // namespace dutch
