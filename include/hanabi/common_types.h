#ifndef HANABI_COMMON_TYPES_H
#define HANABI_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>

namespace hanabi {

// Couleurs des cartes. L'ordre de déclaration sert aussi d'ordre de tri des cartes.
// On peut en ajouter d'autres, à condition que la première lettre de chaque nom
// canonique reste unique (vérifié à la construction du registre des couleurs).
enum class Color : uint8_t {
    RED = 0,
    GREEN,
    BLUE,
    WHITE,
    YELLOW,
    COUNT // Sentinelle, pas une couleur
};

constexpr int NUM_COLORS = static_cast<int>(Color::COUNT);

// Bornes des rangs : une carte valide a un rang dans [MIN_RANK, RANK_LIMIT]
constexpr int MIN_RANK   = 1;
constexpr int RANK_LIMIT = 5;

// Nombre de chiffres décimaux nécessaires pour écrire n (n >= 0)
constexpr std::size_t decimal_digits(int n) {
    std::size_t digits = 1;
    while (n >= 10) {
        n /= 10;
        ++digits;
    }
    return digits;
}

// Une abréviation = une lettre de couleur + le rang en décimal
constexpr std::size_t MIN_ABBREVIATION_LENGTH = 2;
constexpr std::size_t MAX_ABBREVIATION_LENGTH = decimal_digits(RANK_LIMIT) + 1;

constexpr bool is_valid_rank(int rank) {
    return rank >= MIN_RANK && rank <= RANK_LIMIT;
}

// Vrai si c est un membre déclaré de l'enum (protège contre les static_cast hors bornes)
constexpr bool is_valid_color(Color c) {
    return static_cast<uint8_t>(c) < static_cast<uint8_t>(Color::COUNT);
}

// Nom canonique d'une couleur
inline const char* color_to_string(Color c) {
    switch (c) {
        case Color::RED:    return "Red";
        case Color::GREEN:  return "Green";
        case Color::BLUE:   return "Blue";
        case Color::WHITE:  return "White";
        case Color::YELLOW: return "Yellow";
        default:            return "INVALID";
    }
}

} // namespace hanabi

#endif // HANABI_COMMON_TYPES_H
