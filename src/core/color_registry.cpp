#include "core/color_registry.hpp"

#include <cctype>
#include <string>

namespace hanabi {

namespace {

std::vector<ColorRegistry::Entry> all_color_entries() {
    std::vector<ColorRegistry::Entry> entries;
    entries.reserve(NUM_COLORS);
    for (int c = 0; c < NUM_COLORS; ++c) {
        Color color = static_cast<Color>(c);
        entries.push_back({color, color_to_string(color)});
    }
    return entries;
}

} // namespace

const ColorRegistry& color_registry() {
    static const ColorRegistry registry = [] {
        ColorRegistry built(all_color_entries());
        spdlog::debug("ColorRegistry: {} couleurs enregistrées.", built.size());
        return built;
    }();
    return registry;
}

char color_letter(Color c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(color_to_string(c)[0])));
}

Result<Color> parse_color(char first_letter) {
    auto color = color_registry().find_by_letter(first_letter);
    if (!color) {
        spdlog::trace("parse_color: lettre '{}' inconnue.", first_letter);
        return Result<Color>::failure(ErrorKind::UNKNOWN_COLOR_LETTER,
                                      "Unknown card color abbreviation: " + std::string(1, first_letter));
    }
    return Result<Color>::success(*color);
}

Result<Color> parse_color(std::string_view color_name) {
    if (color_name.empty()) {
        return Result<Color>::failure(ErrorKind::COLOR_NAME_EXPECTED, "Color name expected");
    }
    auto color = color_registry().find_by_name(color_name);
    if (!color) {
        spdlog::trace("parse_color: nom '{}' inconnu.", color_name);
        return Result<Color>::failure(ErrorKind::UNKNOWN_COLOR_NAME,
                                      "Unknown color name: " + std::string(color_name));
    }
    return Result<Color>::success(*color);
}

} // namespace hanabi
