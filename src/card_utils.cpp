#include "hanabi/card_utils.hpp"
#include <sstream>

namespace hanabi {

std::string cards_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << cards[i].abbreviation();
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

std::vector<Card> all_cards() {
    std::vector<Card> cards;
    cards.reserve(NUM_DISTINCT_CARDS);
    for (int c = 0; c < NUM_COLORS; ++c) {
        for (int r = MIN_RANK; r <= RANK_LIMIT; ++r) {
            // Toujours valide : c et r parcourent exactement les bornes
            cards.push_back(Card::create(static_cast<Color>(c), r).value());
        }
    }
    return cards;
}

} // namespace hanabi
