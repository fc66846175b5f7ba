#ifndef COBRA_ERRORS_HPP
#define COBRA_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace cobra {

// Base of every error the library raises.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Mistakes in how a tree was built. Dispatch never catches these, even when a handler raises one.
class SetupError : public Error {
public:
    using Error::Error;
};

class MissingUsage : public SetupError {
public:
    MissingUsage() : SetupError("use is required") {}
};

class DuplicateCommand : public SetupError {
public:
    explicit DuplicateCommand(std::string name)
        : SetupError("a command " + name + " already exists"),
          name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
};

class FlagConflict : public SetupError {
public:
    // Both arguments are display forms, e.g. "--port" and "--port -p".
    FlagConflict(std::string flag, std::string existing)
        : SetupError(flag + " has conflict with: " + existing),
          flag_(std::move(flag)),
          existing_(std::move(existing)) {}

    [[nodiscard]] const std::string& flag() const { return flag_; }
    [[nodiscard]] const std::string& existing() const { return existing_; }

private:
    std::string flag_;
    std::string existing_;
};

class InvalidFlag : public SetupError {
public:
    using SetupError::SetupError;
};

// Dispatch-time errors.

class AmbiguousCommand : public Error {
public:
    explicit AmbiguousCommand(std::string token)
        : Error("ambiguous command " + token),
          token_(std::move(token)) {}

    [[nodiscard]] const std::string& token() const { return token_; }

private:
    std::string token_;
};

class UnknownFlag : public Error {
public:
    explicit UnknownFlag(std::string key)
        : Error("unknown flag '" + key + "'"),
          key_(std::move(key)) {}

    [[nodiscard]] const std::string& key() const { return key_; }

private:
    std::string key_;
};

class RequiredFlagMissing : public Error {
public:
    explicit RequiredFlagMissing(std::string flag)
        : Error(flag + " is required"),
          flag_(std::move(flag)) {}

    // Display form of the flag, e.g. "--name".
    [[nodiscard]] const std::string& flag() const { return flag_; }

private:
    std::string flag_;
};

class InvalidFlagValue : public Error {
public:
    InvalidFlagValue(std::string key, const std::string& value, const std::string& expected)
        : Error("invalid " + expected + " value '" + value + "' for flag '" + key + "'"),
          key_(std::move(key)) {}

    [[nodiscard]] const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace cobra

#endif // COBRA_ERRORS_HPP
