// =============================================================================
// fastq-detangler - Pairing Index
// =============================================================================
// Maps each read identifier to the set of mate numbers seen for it.
//
// An (identifier, mate) pair may be inserted once. A repeat means the input
// holds duplicate headers and is reported as DuplicateMateError rather than
// overwritten.
// =============================================================================

#ifndef FQD_ALGO_PAIRING_INDEX_H
#define FQD_ALGO_PAIRING_INDEX_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "fqd/common/error.h"
#include "fqd/common/types.h"
#include "fqd/io/fastq_parser.h"

namespace fqd::algo {

// =============================================================================
// MateSet
// =============================================================================

/// @brief Set of mate numbers observed for one identifier (two bits).
class MateSet {
public:
    constexpr MateSet() noexcept = default;

    [[nodiscard]] constexpr bool contains(MateNumber mate) const noexcept {
        return (bits_ & bit(mate)) != 0;
    }

    /// @return false if the mate was already present.
    constexpr bool insert(MateNumber mate) noexcept {
        if (contains(mate)) {
            return false;
        }
        bits_ = static_cast<std::uint8_t>(bits_ | bit(mate));
        return true;
    }

    [[nodiscard]] constexpr bool isPair() const noexcept {
        return contains(MateNumber::kFirst) && contains(MateNumber::kSecond);
    }

private:
    static constexpr std::uint8_t bit(MateNumber mate) noexcept {
        return static_cast<std::uint8_t>(1U << static_cast<unsigned>(mate));
    }

    std::uint8_t bits_ = 0;
};

// =============================================================================
// PairingIndex
// =============================================================================

/// @brief Identifier -> mates observed, built in one pass and then queried.
class PairingIndex {
public:
    PairingIndex() = default;

    /// @brief Pre-size for an expected number of identifiers.
    void reserve(std::size_t identifiers) { entries_.reserve(identifiers); }

    /// @brief Record a mate for an identifier.
    /// @param context Location attached to a DuplicateMateError.
    /// @throws DuplicateMateError if that mate was already recorded.
    void insert(std::string_view identifier, MateNumber mate, const ErrorContext& context = {});

    [[nodiscard]] bool contains(std::string_view identifier, MateNumber mate) const;

    /// @brief Whether the opposite mate of `record` is present.
    [[nodiscard]] bool hasPartner(const io::ReadRecord& record) const {
        return contains(record.identifier, partnerOf(record.mate));
    }

    /// @brief Number of distinct identifiers.
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @brief Number of identifiers holding both mates.
    [[nodiscard]] std::size_t pairCount() const noexcept { return pairCount_; }

private:
    /// @brief Transparent hash so lookups by string_view do not allocate.
    struct IdentifierHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view id) const noexcept {
            return std::hash<std::string_view>{}(id);
        }
    };

    std::unordered_map<std::string, MateSet, IdentifierHash, std::equal_to<>> entries_;
    std::size_t pairCount_ = 0;
};

}  // namespace fqd::algo

#endif  // FQD_ALGO_PAIRING_INDEX_H
