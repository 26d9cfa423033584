#include "error.hh"
#include <string>

namespace dutch {

std::optional<AuctionError> auction_error_from(const ProgramResult& result) {
    if (!result.is_custom() || result.custom_code > AUCTION_ERROR_MAX) {
        return std::nullopt;
    }
    return static_cast<AuctionError>(result.custom_code);
}

std::string describe_result(const ProgramResult& result) {
    if (auto error = auction_error_from(result)) {
        return std::string(auction_error_string(*error));
    }
    return result.to_string();
}

}  // namespace dutch
