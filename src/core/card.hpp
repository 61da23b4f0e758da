#ifndef HANABI_CARD_HPP
#define HANABI_CARD_HPP

#include "hanabi/common_types.h"
#include "hanabi/result.h"

#include <cstddef>
#include <functional> // Pour std::hash
#include <ostream>
#include <string>
#include <string_view>

namespace hanabi {

// Carte de Hanabi : une couleur et un rang.
// Immuable : pas de setter, les seules façons d'obtenir une carte passent par
// les fabriques validantes ci-dessous.
class Card {
public:
    // Échoue avec COLOR_OUT_OF_RANGE si color n'est pas un membre déclaré de Color,
    // RANK_OUT_OF_RANGE si rank est hors de [MIN_RANK, RANK_LIMIT].
    static Result<Card> create(Color color, int rank);

    // Construit une carte depuis son abréviation, ex: "G1", "B5", "W2".
    // Format: [Lettre de couleur][Rang]. Vérifie dans l'ordre : chaîne vide, trop courte,
    // trop longue, lettre de couleur, puis rang.
    static Result<Card> from_abbreviation(std::string_view abbreviation);

    Color color() const { return color_; }
    int rank() const { return rank_; }

    // "R1" pour le 1 rouge ; repasse à l'identique par from_abbreviation()
    std::string abbreviation() const;

    // "Red 1" pour le 1 rouge ; affichage seulement
    std::string display_name() const;

    bool operator==(const Card& other) const {
        return color_ == other.color_ && rank_ == other.rank_;
    }

    bool operator!=(const Card& other) const {
        return !(*this == other);
    }

    // Ordre : couleur (ordre de déclaration de Color), puis rang croissant
    bool operator<(const Card& other) const {
        if (color_ != other.color_) return color_ < other.color_;
        return rank_ < other.rank_;
    }

private:
    Card(Color color, int rank) : color_(color), rank_(rank) {}

    Color color_;
    int   rank_;
};

std::string to_string(Color c);
std::string to_string(const Card& card);

std::ostream& operator<<(std::ostream& os, const Card& card);

} // namespace hanabi

namespace std {

template <>
struct hash<hanabi::Card> {
    std::size_t operator()(const hanabi::Card& card) const {
        return static_cast<std::size_t>(card.color()) * (hanabi::RANK_LIMIT + 1) +
               static_cast<std::size_t>(card.rank());
    }
};

} // namespace std

#endif // HANABI_CARD_HPP
