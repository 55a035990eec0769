#include "mh/model/PrototypeKey.hpp"

#include "mh/core/Error.hpp"

#include <tuple>
#include <utility>

namespace mh::model {

PrototypeKey::PrototypeKey(std::string kindValue, std::string nameValue)
    : kind(std::move(kindValue)),
      name(std::move(nameValue)) {}

std::string PrototypeKey::ToString() const {
    return FormatKey(kind, name);
}

PrototypeKey PrototypeKey::Parse(std::string_view text) {
    const auto separator = text.find(kSeparator);
    if (separator == std::string_view::npos) {
        throw core::KeyFormatError(text, "missing '.' separator");
    }
    if (separator == 0) {
        throw core::KeyFormatError(text, "empty kind");
    }
    return PrototypeKey(std::string(text.substr(0, separator)),
                        std::string(text.substr(separator + 1)));
}

bool PrototypeKey::operator<(const PrototypeKey& other) const {
    return std::tie(kind, name) < std::tie(other.kind, other.name);
}

std::string FormatKey(std::string_view kind, std::string_view name) {
    std::string key;
    key.reserve(kind.size() + name.size() + 1);
    key.append(kind);
    key.push_back(PrototypeKey::kSeparator);
    key.append(name);
    return key;
}

} // namespace mh::model
