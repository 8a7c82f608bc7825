#include "saved_session.hpp"

#include <algorithm>

void sort_for_display(std::vector<SavedSession>& sessions) {
    std::ranges::sort(sessions, [](const SavedSession& a, const SavedSession& b) {
        if (a.last_activity != b.last_activity) return a.last_activity > b.last_activity;
        return a.id < b.id;
    });

    int ordinal = 1;
    for (auto& s : sessions) s.ordinal = ordinal++;
}
