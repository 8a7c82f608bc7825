#include "session_resolver.hpp"

#include <charconv>
#include <format>

namespace {

// Positive decimal integer with no sign, spaces or trailing characters.
bool parse_ordinal(const std::string& token, size_t& out) {
    if (token.empty() || token[0] == '0') return false;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc{} && ptr == token.data() + token.size();
}

} // namespace

std::string ResolutionError::message() const {
    switch (kind) {
        case Kind::NotFound:
            return std::format("no session matches '{}'", token);
        case Kind::Ambiguous: {
            std::string msg = std::format("'{}' matches {} sessions:", token, matches.size());
            for (const auto& id : matches) msg += "\n  " + id;
            return msg;
        }
    }
    return "unknown resolution error";
}

std::expected<SavedSession, ResolutionError> resolve(const std::string& token,
                                                     const std::vector<SavedSession>& sessions) {
    ResolutionError err{.kind = ResolutionError::Kind::NotFound, .token = token};
    if (sessions.empty() || token.empty()) return std::unexpected(err);

    // A positive integer is always an ordinal, even past the end of the list.
    size_t ordinal = 0;
    if (parse_ordinal(token, ordinal)) {
        if (ordinal > sessions.size()) return std::unexpected(err);
        return sessions[ordinal - 1];
    }

    const SavedSession* found = nullptr;
    for (const auto& s : sessions) {
        if (s.id.find(token) == std::string::npos) continue;
        if (!found) found = &s;
        err.matches.push_back(s.id);
    }

    if (err.matches.size() == 1) return *found;
    if (err.matches.size() > 1) err.kind = ResolutionError::Kind::Ambiguous;
    return std::unexpected(err);
}
