#pragma once

#include "saved_session.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// Reads the agent's session store: <root>/<project>/<session-id>.jsonl, one
// JSON event per line.
class SessionStore {
public:
    explicit SessionStore(std::string root, size_t summary_length = 60);

    // Sorted for display with ordinals assigned. A missing root is an empty
    // store; a root that exists but cannot be listed is an error.
    std::expected<std::vector<SavedSession>, std::string> list_checked(std::stop_token stop = {}) const;

    // Same, but a listing error is reported on stderr and yields no sessions.
    std::vector<SavedSession> list_sessions(std::stop_token stop = {}) const;

    const std::string& root() const { return root_; }

    // nullopt for a malformed record (no parseable, non-sidechain event) and
    // when a stop is requested part way through the file.
    static std::optional<SavedSession> parse_record(const std::filesystem::path& file,
                                                    size_t summary_length,
                                                    std::stop_token stop = {});

    // "2025-06-01T10:20:30.123Z" and offsets like "+02:00".
    static std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);

    // Collapses whitespace and cuts to max_chars code points, ending in "...".
    static std::string make_summary(const std::string& text, size_t max_chars);

    // "-home-me-proj" -> "/home/me/proj". Lossy for names containing '-'.
    static std::string decode_project_dir(const std::string& name);

private:
    struct CachedRecord {
        std::filesystem::file_time_type mtime;
        std::uintmax_t size = 0;
        std::optional<SavedSession> record;
    };

    std::optional<SavedSession> load_record(const std::filesystem::path& file,
                                            std::map<std::string, CachedRecord>& seen,
                                            std::stop_token stop) const;

    std::string root_;
    size_t summary_length_;

    // Records from the previous listing, reused while (mtime, size) match.
    mutable std::mutex cache_mu_;
    mutable std::map<std::string, CachedRecord> cache_;
};
