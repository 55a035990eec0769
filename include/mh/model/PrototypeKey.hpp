#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace mh::model {

/**
 * @brief Identifies one definable game object, rendered canonically as "kind.name".
 *
 * The kind never contains the separator; the name may (only the first '.'
 * splits a rendered key).
 */
struct PrototypeKey {
    static constexpr char kSeparator = '.';

    std::string kind;
    std::string name;

    PrototypeKey() = default;
    PrototypeKey(std::string kindValue, std::string nameValue);

    [[nodiscard]] std::string ToString() const;

    /// @throws mh::core::KeyFormatError when no separator is present or the kind is empty.
    static PrototypeKey Parse(std::string_view text);

    bool operator==(const PrototypeKey& other) const = default;
    bool operator<(const PrototypeKey& other) const;
};

std::string FormatKey(std::string_view kind, std::string_view name);

} // namespace mh::model

template <>
struct std::hash<mh::model::PrototypeKey> {
    std::size_t operator()(const mh::model::PrototypeKey& key) const noexcept {
        const std::size_t h1 = std::hash<std::string>{}(key.kind);
        const std::size_t h2 = std::hash<std::string>{}(key.name);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
