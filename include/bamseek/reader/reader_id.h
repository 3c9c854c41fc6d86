// =============================================================================
// bamseek - Reader and Stream Identifiers
// =============================================================================
// Non-owning keys for readers and block streams owned elsewhere (typically a
// registry in the query engine). Holding or destroying an identifier has no
// effect on the object it names.
// =============================================================================

#ifndef BAMSEEK_READER_READER_ID_H
#define BAMSEEK_READER_READER_ID_H

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace bamseek::reader {

/// @brief Identifies an alignment reader in an external registry.
struct ReaderId {
    std::uint32_t value = 0;

    friend constexpr auto operator<=>(const ReaderId&, const ReaderId&) = default;
};

/// @brief Identifies the block input stream paired with a reader.
struct StreamId {
    std::uint32_t value = 0;

    friend constexpr auto operator<=>(const StreamId&, const StreamId&) = default;
};

}  // namespace bamseek::reader

template <>
struct std::hash<bamseek::reader::ReaderId> {
    std::size_t operator()(const bamseek::reader::ReaderId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.value);
    }
};

template <>
struct std::hash<bamseek::reader::StreamId> {
    std::size_t operator()(const bamseek::reader::StreamId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.value);
    }
};

#endif  // BAMSEEK_READER_READER_ID_H
