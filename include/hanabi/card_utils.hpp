#ifndef HANABI_CARD_UTILS_HPP
#define HANABI_CARD_UTILS_HPP

#include "core/card.hpp"
#include <string>
#include <vector>

namespace hanabi {

// Liste d'abréviations entre crochets, ex: "[R1 G2 B5]"
std::string cards_to_string(const std::vector<Card>& cards);

// Nombre de cartes distinctes possibles (NUM_COLORS * RANK_LIMIT)
constexpr int NUM_DISTINCT_CARDS = NUM_COLORS * RANK_LIMIT;

// Toutes les cartes possibles, une par (couleur, rang), dans l'ordre de Card::operator<
std::vector<Card> all_cards();

} // namespace hanabi

#endif // HANABI_CARD_UTILS_HPP
