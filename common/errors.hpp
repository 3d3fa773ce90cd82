#ifndef FURNACELINE_COMMON_ERRORS_HPP
#define FURNACELINE_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace furnaceline {

// Input combination is not a valid furnace line (e.g. sides not opposite)
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Furnace, belt or side identifier outside the supported set
class UnknownIdentifierError : public std::runtime_error {
public:
    UnknownIdentifierError(const std::string& kind, const std::string& identifier,
                           const std::string& accepted)
        : std::runtime_error("Unknown " + kind + " '" + identifier +
                             "' (expected one of: " + accepted + ")"),
          kind_(kind), identifier_(identifier) {}

    const std::string& kind() const { return kind_; }
    const std::string& identifier() const { return identifier_; }

private:
    std::string kind_;
    std::string identifier_;
};

}  // namespace furnaceline

#endif // FURNACELINE_COMMON_ERRORS_HPP
