#ifndef HANABI_COLOR_REGISTRY_HPP
#define HANABI_COLOR_REGISTRY_HPP

#include "hanabi/common_types.h"
#include "hanabi/result.h"
#include "spdlog/spdlog.h"

#include <cctype>
#include <cstddef>
#include <functional> // Pour std::less<>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hanabi {

// Table lettre -> couleur et nom -> couleur, construite une seule fois.
//
// Les clés par lettre sont la première lettre du nom canonique mise en majuscule :
// deux noms qui ne diffèrent que par la casse de leur initiale entrent donc en collision.
// Si une même couleur apparaît plusieurs fois (alias), seule sa première entrée compte.
// Paramétrée par le type de couleur pour pouvoir tester des ensembles de couleurs factices.
template <typename ColorT>
class ColorTable {
public:
    struct Entry {
        ColorT           color;
        std::string_view name;
    };

    // Lève ColorRegistryError si deux couleurs distinctes partagent la même initiale
    explicit ColorTable(const std::vector<Entry>& entries) {
        for (const Entry& entry : entries) {
            if (entry.name.empty()) {
                spdlog::critical("ColorTable: couleur sans nom canonique.");
                throw ColorRegistryError("Color name cannot be empty");
            }
            if (names_by_color_.count(entry.color) > 0) {
                continue; // Alias : on ignore
            }

            const char letter = normalize_letter(entry.name.front());
            auto existing = by_letter_.find(letter);
            if (existing != by_letter_.end()) {
                const std::string& other = names_by_color_.at(existing->second);
                spdlog::critical("ColorTable: '{}' et '{}' commencent par la même lettre '{}'.",
                                 other, entry.name, letter);
                throw ColorRegistryError("Two colors can't start with the same letter: '" +
                                         std::string(1, letter) + "' (" + other + ", " +
                                         std::string(entry.name) + ")");
            }

            by_letter_.emplace(letter, entry.color);
            by_name_.emplace(std::string(entry.name), entry.color);
            names_by_color_.emplace(entry.color, std::string(entry.name));
        }
    }

    // Recherche sensible à la casse : seules les majuscules sont des clés
    std::optional<ColorT> find_by_letter(char letter) const {
        auto it = by_letter_.find(letter);
        if (it == by_letter_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Correspondance exacte (casse comprise) avec un nom canonique
    std::optional<ColorT> find_by_name(std::string_view name) const {
        auto it = by_name_.find(name);
        if (it == by_name_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t size() const { return by_letter_.size(); }

private:
    static char normalize_letter(char c) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::map<char, ColorT>                       by_letter_;
    std::map<std::string, ColorT, std::less<>>   by_name_;
    std::map<ColorT, std::string>                names_by_color_;
};

using ColorRegistry = ColorTable<Color>;

// Registre global des couleurs de Color. Construit au premier appel (thread-safe),
// en lecture seule ensuite. Lève ColorRegistryError si l'enum est mal formé ;
// dans ce cas chaque appel suivant retente la construction et échoue de même.
const ColorRegistry& color_registry();

// Première lettre du nom canonique ('R' pour Color::RED)
char color_letter(Color c);

// Fonctions de parsing des couleurs
Result<Color> parse_color(char first_letter);
Result<Color> parse_color(std::string_view color_name);

} // namespace hanabi

#endif // HANABI_COLOR_REGISTRY_HPP
