#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace taptiles {

struct SheetParseResult {
    bool ok = false;
    std::vector<int> notes;
    std::string error;   // first offending token and why, when !ok
};

// Space separated note indices, each in [0, note_count). Any bad token fails
// the whole sheet; no valid prefix is kept.
SheetParseResult parse_sheet(const std::string &text, int note_count);

class NoteSheet {
public:
    // replaces the current sheet on success, clears it on failure
    SheetParseResult load(const std::vector<uint8_t> &data, const std::string &filename, int note_count);
    void clear();

    bool loaded() const { return loaded_; }
    const std::vector<int> &notes() const { return notes_; }
    const std::string &filename() const { return filename_; }
    std::string status_text() const;

    // note for the hit that produced `score`. Score 0 wraps to the last entry.
    int note_for_score(int score) const;

private:
    std::vector<int> notes_;
    std::string filename_;
    bool loaded_ = false;
};

} // namespace taptiles
