#ifndef HOLDEM_COMMON_TYPES_H
#define HOLDEM_COMMON_TYPES_H

#include <cstddef>

namespace holdem_eval {

// Enum pour les tours de jeu
enum class Street {
    PREFLOP,
    FLOP,
    TURN,
    RIVER
};

// Force stratégique grossière consommée par la logique de mise.
// L'ordre des valeurs est significatif (comparaisons < et >=).
enum class StrengthTier {
    TRASH,         // Injouable
    MARGINAL,      // Candidats au bluff
    WEAK_PLAYABLE, // Faible mais jouable
    DECENT,        // Jouable
    STRONG,        // Très forte
    PREMIUM        // Nuts ou presque
};

// Provenance d'un résultat : sans effet sur son contenu
enum class EvaluationSource {
    ORACLE,
    LOCAL
};

inline const char* tier_to_string(StrengthTier tier) {
    switch (tier) {
        case StrengthTier::TRASH:         return "TRASH";
        case StrengthTier::MARGINAL:      return "MARGINAL";
        case StrengthTier::WEAK_PLAYABLE: return "WEAK_PLAYABLE";
        case StrengthTier::DECENT:        return "DECENT";
        case StrengthTier::STRONG:        return "STRONG";
        case StrengthTier::PREMIUM:       return "PREMIUM";
        default:                          return "INVALID";
    }
}

inline const char* source_to_string(EvaluationSource source) {
    return source == EvaluationSource::ORACLE ? "ORACLE" : "LOCAL";
}

} // namespace holdem_eval

#endif // HOLDEM_COMMON_TYPES_H
