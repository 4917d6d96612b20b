#pragma once
// include/voyage/core/Errors.hpp
//
// Exception taxonomy shared by the weather engine, the journey layer and the CLI.
// Everything derives from voyage::Error so the front end can catch one type.

#include <stdexcept>
#include <string>

namespace voyage {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unknown region/season/weather key, or a setting outside its documented range.
// Fatal to the single call; no state is mutated.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// The journey store could not read or write a document.
class StorageError : public Error {
public:
    using Error::Error;
};

// Caller handed the engine a state it can never produce itself
// (both events active, remaining/total out of range, negative cooldown).
class InvariantViolation : public Error {
public:
    using Error::Error;
};

class JourneyNotFound : public Error {
public:
    explicit JourneyNotFound(const std::string& key)
        : Error("no journey for key '" + key + "'"), m_key(key) {}

    const std::string& key() const noexcept { return m_key; }

private:
    std::string m_key;
};

} // namespace voyage
