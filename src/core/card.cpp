#include "core/card.hpp"
#include "core/color_registry.hpp"
#include "core/rank.hpp"

#include <string>

namespace hanabi {

Result<Card> Card::create(Color color, int rank) {
    if (!is_valid_color(color)) {
        return Result<Card>::failure(ErrorKind::COLOR_OUT_OF_RANGE,
                                     "Card color out of range: " + std::to_string(static_cast<int>(color)));
    }
    if (!is_valid_rank(rank)) {
        return Result<Card>::failure(ErrorKind::RANK_OUT_OF_RANGE,
                                     "Card rank out of range: " + std::to_string(rank));
    }
    return Result<Card>::success(Card(color, rank));
}

Result<Card> Card::from_abbreviation(std::string_view abbreviation) {
    if (abbreviation.empty()) {
        return Result<Card>::failure(ErrorKind::ABBREVIATION_EXPECTED, "Card abbreviation expected");
    }
    if (abbreviation.size() < MIN_ABBREVIATION_LENGTH) {
        return Result<Card>::failure(ErrorKind::ABBREVIATION_TOO_SHORT,
                                     "Card abbreviation must be at least " +
                                     std::to_string(MIN_ABBREVIATION_LENGTH) + " symbols long: " +
                                     std::string(abbreviation));
    }
    if (abbreviation.size() > MAX_ABBREVIATION_LENGTH) {
        return Result<Card>::failure(ErrorKind::ABBREVIATION_TOO_LONG,
                                     "Card abbreviation can't be more than " +
                                     std::to_string(MAX_ABBREVIATION_LENGTH) + " symbols long: " +
                                     std::string(abbreviation));
    }

    // La couleur d'abord : si la lettre est inconnue, le rang n'est pas lu
    Result<Color> color = parse_color(abbreviation[0]);
    if (!color) {
        return color.forward_error<Card>();
    }
    Result<int> rank = parse_rank(abbreviation.substr(1));
    if (!rank) {
        return rank.forward_error<Card>();
    }
    return create(color.value(), rank.value());
}

std::string Card::abbreviation() const {
    return std::string(1, color_letter(color_)) + std::to_string(rank_);
}

std::string Card::display_name() const {
    return to_string(color_) + " " + std::to_string(rank_);
}

std::string to_string(Color c) {
    return color_to_string(c);
}

std::string to_string(const Card& card) {
    return card.display_name();
}

std::ostream& operator<<(std::ostream& os, const Card& card) {
    return os << card.display_name();
}

} // namespace hanabi
