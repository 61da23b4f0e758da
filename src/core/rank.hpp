#ifndef HANABI_RANK_HPP
#define HANABI_RANK_HPP

#include "hanabi/common_types.h"
#include "hanabi/result.h"

#include <string_view>

namespace hanabi {

// Parse la partie "rang" d'une abréviation ("1".."5").
// Erreurs : RANK_EXPECTED si vide, RANK_NOT_INTEGER si ce n'est pas un entier
// en base 10 (espaces, '+', décimales refusés), RANK_OUT_OF_RANGE hors [MIN_RANK, RANK_LIMIT].
Result<int> parse_rank(std::string_view rank);

} // namespace hanabi

#endif // HANABI_RANK_HPP
