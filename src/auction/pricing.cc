#include "auction/pricing.hh"
#include "core/logging.hh"
#include <limits>

namespace dutch {

PriceState current_price(const AuctionRecord& record, unix_timestamp_t now) {
    if (now < record.time_start) {
        return PriceState::not_started();
    }
    if (record.time_step <= 0) {
        log::pricing.warn("auction record has non-positive time_step, treating as finished");
        return PriceState::finished();
    }

    // now >= time_start, so the unsigned difference is exact even when the
    // signed one would overflow
    const auto elapsed = static_cast<std::uint64_t>(now) - static_cast<std::uint64_t>(record.time_start);
    const std::uint64_t steps = elapsed / static_cast<std::uint64_t>(record.time_step);

    if (record.price_step != 0 &&
        steps > std::numeric_limits<std::uint64_t>::max() / record.price_step) {
        return PriceState::finished();
    }
    const std::uint64_t decay = record.price_step * steps;

    if (decay >= record.price_start) {
        return PriceState::finished();
    }
    return PriceState::active(record.price_start - decay);
}

}  // namespace dutch
