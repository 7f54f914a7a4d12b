#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    TransientNetwork,     // hálózat / 5xx / rate limit — a következő ciklus újrapróbálja
    NotFound,             // pl. már nem létező order törlése
    Rejected,             // a tőzsde elutasította a kérést
    InsufficientData,
    InvalidConfiguration
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::TransientNetwork:     return "TransientNetworkError";
        case ErrorKind::NotFound:             return "NotFound";
        case ErrorKind::Rejected:             return "Rejected";
        case ErrorKind::InsufficientData:     return "InsufficientData";
        default:                              return "InvalidConfiguration";
    }
}

// Túl kevés gyertya az indikátorokhoz / jelhez
class InsufficientData : public std::runtime_error {
public:
    explicit InsufficientData(const std::string& what) : std::runtime_error(what) {}
};

// Hibás konfiguráció (időformátum, nem numerikus / nem pozitív mezők)
class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& what) : std::runtime_error(what) {}
};
