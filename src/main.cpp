#include "core/card.hpp"
#include "core/color_registry.hpp"
#include "hanabi/card_utils.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/cfg/env.h"

#include <iostream>   // std::cout, std::cerr
#include <vector>     // std::vector
#include <exception>  // std::exception

// Lit des abréviations de cartes sur la ligne de commande et affiche leur nom complet.
//   hanabi_card_tool G1 R5 Z9
// Niveau de log réglable par la variable d'environnement SPDLOG_LEVEL (ex: SPDLOG_LEVEL=debug).
int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    if (argc < 2)
    {
        std::cerr << "Usage : " << argv[0] << " <abréviation> [<abréviation>...]\n"
                  << "  ex : " << argv[0] << " G1 R5 W2\n";
        return 2;
    }

    try
    {
        // Construit le registre tout de suite : un ensemble de couleurs invalide
        // doit faire échouer le programme avant tout parsing.
        const hanabi::ColorRegistry& registry = hanabi::color_registry();
        spdlog::debug("{} couleurs, rang maximal {}, abréviation de {} caractères au plus.",
                      registry.size(), hanabi::RANK_LIMIT, hanabi::MAX_ABBREVIATION_LENGTH);

        std::vector<hanabi::Card> cards;
        int rejected = 0;
        for (int i = 1; i < argc; ++i)
        {
            auto card = hanabi::Card::from_abbreviation(argv[i]);
            if (!card)
            {
                spdlog::warn("'{}' rejetée ({}) : {}", argv[i],
                             hanabi::error_kind_to_string(card.error().kind),
                             card.error().message);
                ++rejected;
                continue;
            }
            std::cout << card.value().display_name() << '\n';
            cards.push_back(card.value());
        }

        spdlog::info("{} carte(s) reconnue(s) : {}", cards.size(), hanabi::cards_to_string(cards));
        if (rejected > 0)
        {
            spdlog::info("{} abréviation(s) rejetée(s).", rejected);
            return 1;
        }
    }
    catch (const hanabi::ColorRegistryError& e)
    {
        spdlog::critical("Registre des couleurs invalide : {}", e.what());
        std::cerr << "Registre des couleurs invalide : " << e.what() << '\n';
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    return 0;
}
