#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mh::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

/// Raised when a prototype key string is not of the form "kind.name".
class KeyFormatError : public Error {
public:
    KeyFormatError(std::string_view key, std::string details);

    std::string_view key() const noexcept { return m_key; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view key, const std::string& details);

    std::string m_key;
    std::string m_details;
};

inline std::string KeyFormatError::BuildMessage(std::string_view key, const std::string& details) {
    std::string message;
    message.reserve(key.size() + details.size() + 32);
    message.append("Invalid prototype key format '");
    message.append(key);
    message.append("'");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline KeyFormatError::KeyFormatError(std::string_view key, std::string details)
    : Error(BuildMessage(key, details)),
      m_key(key),
      m_details(std::move(details)) {}

} // namespace mh::core
