// =============================================================================
// fastq-detangler - Pairing Index Implementation
// =============================================================================

#include "fqd/algo/pairing_index.h"

namespace fqd::algo {

void PairingIndex::insert(std::string_view identifier, MateNumber mate,
                          const ErrorContext& context) {
    auto it = entries_.find(identifier);
    if (it == entries_.end()) {
        it = entries_.emplace(std::string(identifier), MateSet{}).first;
    }

    if (!it->second.insert(mate)) {
        throw DuplicateMateError(std::string(identifier), mate, context);
    }

    if (it->second.isPair()) {
        ++pairCount_;
    }
}

bool PairingIndex::contains(std::string_view identifier, MateNumber mate) const {
    auto it = entries_.find(identifier);
    return it != entries_.end() && it->second.contains(mate);
}

}  // namespace fqd::algo
