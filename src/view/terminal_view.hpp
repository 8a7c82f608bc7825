#pragma once

#include "refresh_loop.hpp"
#include "rows.hpp"

#include <cstdio>
#include <string>
#include <vector>

// Full-screen redraw on a plain ANSI terminal.
class TerminalView : public SessionView {
public:
    TerminalView(std::string agent, size_t path_width, std::FILE* out = stdout);

    void render(const Snapshot& snapshot) override;
    void render_error(const std::string& message, uint32_t consecutive_failures) override;

    // One-shot listing used by `list`.
    static void print_saved(std::FILE* out, const std::vector<SavedRow>& rows, bool color);

private:
    void clear();
    void print_live(const std::vector<LiveRow>& rows);
    const char* paint(const char* code) const { return color_ ? code : ""; }

    std::string agent_;
    size_t path_width_;
    std::FILE* out_;
    bool color_;
};
