#include "core/rank.hpp"
#include "spdlog/spdlog.h"

#include <charconv>
#include <string>
#include <system_error>

namespace hanabi {

Result<int> parse_rank(std::string_view rank) {
    if (rank.empty()) {
        return Result<int>::failure(ErrorKind::RANK_EXPECTED, "Rank string expected");
    }

    int value = 0;
    const char* first = rank.data();
    const char* last  = rank.data() + rank.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        spdlog::trace("parse_rank: '{}' n'est pas un entier.", rank);
        return Result<int>::failure(ErrorKind::RANK_NOT_INTEGER,
                                    "Card rank must be an integer: " + std::string(rank));
    }

    if (!is_valid_rank(value)) {
        spdlog::trace("parse_rank: {} hors de [{}, {}].", value, MIN_RANK, RANK_LIMIT);
        return Result<int>::failure(ErrorKind::RANK_OUT_OF_RANGE,
                                    "Card rank out of range: " + std::to_string(value));
    }
    return Result<int>::success(value);
}

} // namespace hanabi
