#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace core {

// Kevesebb bar, mint a leghosszabb szükséges ablak. Nem fatális: a hívó kapja meg,
// szimuláció nem indul.
class InsufficientData : public std::runtime_error {
public:
    InsufficientData(std::size_t have, std::size_t need, const std::string& what)
        : std::runtime_error(what), have_(have), need_(need) {}
    std::size_t have() const { return have_; }
    std::size_t need() const { return need_; }
private:
    std::size_t have_;
    std::size_t need_;
};

// Hiányzó / hibás mező a bemeneti bar táblában (csak az adott futásra fatális)
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Nem pozitív ablak, szorzó, tőke stb. Minden számítás előtt dobjuk.
class InvalidConfiguration : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ErrorKind { None, InsufficientData, SchemaError, InvalidConfiguration, Internal };

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::InsufficientData:     return "InsufficientData";
        case ErrorKind::SchemaError:          return "SchemaError";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorKind::Internal:             return "Internal";
        default:                              return "None";
    }
}

// Elkapott kivétel -> hibafajta; ismeretlen std::exception -> Internal
inline ErrorKind classify(const std::exception& e) {
    if (dynamic_cast<const InsufficientData*>(&e))     return ErrorKind::InsufficientData;
    if (dynamic_cast<const SchemaError*>(&e))          return ErrorKind::SchemaError;
    if (dynamic_cast<const InvalidConfiguration*>(&e)) return ErrorKind::InvalidConfiguration;
    return ErrorKind::Internal;
}

// Folyamat kilépési kód a kumo_backtester-hez (1 = használat, 3 = riport írás)
inline int exit_code(ErrorKind k) {
    switch (k) {
        case ErrorKind::InvalidConfiguration: return 2;
        case ErrorKind::InsufficientData:     return 4;
        case ErrorKind::SchemaError:          return 5;
        case ErrorKind::Internal:             return 6;
        default:                              return 0;
    }
}

} // namespace core
