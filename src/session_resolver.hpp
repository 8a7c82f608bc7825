#pragma once

#include "saved_session.hpp"

#include <expected>
#include <string>
#include <vector>

struct ResolutionError {
    enum class Kind { NotFound, Ambiguous };

    Kind kind = Kind::NotFound;
    std::string token;
    std::vector<std::string> matches;  // ids matching an ambiguous fragment

    std::string message() const;
};

// Picks one session by ordinal (1-based position in `sessions` as displayed)
// or by a case-sensitive id fragment. Never guesses between several matches.
// Ordinals are only as good as the listing they came from; re-list first.
std::expected<SavedSession, ResolutionError> resolve(const std::string& token,
                                                     const std::vector<SavedSession>& sessions);
