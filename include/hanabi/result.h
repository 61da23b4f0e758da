#ifndef HANABI_RESULT_H
#define HANABI_RESULT_H

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace hanabi {

// Causes possibles d'un échec de parsing / construction.
// Ce sont toutes des erreurs d'entrée, récupérables par l'appelant.
enum class ErrorKind {
    ABBREVIATION_EXPECTED,
    ABBREVIATION_TOO_SHORT,
    ABBREVIATION_TOO_LONG,
    UNKNOWN_COLOR_LETTER,
    COLOR_NAME_EXPECTED,
    UNKNOWN_COLOR_NAME,
    COLOR_OUT_OF_RANGE,
    RANK_EXPECTED,
    RANK_NOT_INTEGER,
    RANK_OUT_OF_RANGE
};

const char* error_kind_to_string(ErrorKind kind);

struct CardError {
    ErrorKind   kind;
    std::string message; // Message lisible, contient l'entrée fautive

    bool operator==(const CardError& other) const {
        return kind == other.kind && message == other.message;
    }
};

// Levée par Result<T>::value() quand le résultat est un échec
class CardParseError : public std::invalid_argument {
public:
    explicit CardParseError(CardError error);

    const CardError& error() const { return error_; }
    ErrorKind kind() const { return error_.kind; }

private:
    CardError error_;
};

// Erreur de configuration : l'ensemble des couleurs lui-même est invalide
// (deux couleurs avec la même première lettre, nom vide...).
// Ce n'est jamais une erreur d'entrée utilisateur.
class ColorRegistryError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Résultat explicite succès / échec d'une opération de parsing.
// L'appelant doit tester ok() avant value(), sinon value() lève CardParseError.
template <typename T>
class [[nodiscard]] Result {
public:
    static Result success(T value) {
        return Result(std::variant<T, CardError>(std::in_place_index<0>, std::move(value)));
    }

    static Result failure(CardError error) {
        return Result(std::variant<T, CardError>(std::in_place_index<1>, std::move(error)));
    }

    static Result failure(ErrorKind kind, std::string message) {
        return failure(CardError{kind, std::move(message)});
    }

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            throw CardParseError(std::get<1>(data_));
        }
        return std::get<0>(data_);
    }

    const CardError& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() called on a successful result");
        }
        return std::get<1>(data_);
    }

    // Propage l'erreur vers un Result d'un autre type (ex: Result<Color> -> Result<Card>)
    template <typename U>
    Result<U> forward_error() const {
        return Result<U>::failure(error());
    }

private:
    explicit Result(std::variant<T, CardError> data) : data_(std::move(data)) {}

    std::variant<T, CardError> data_;
};

} // namespace hanabi

#endif // HANABI_RESULT_H
