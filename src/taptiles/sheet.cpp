#include "sheet.h"
#include <algorithm>
#include <iostream>

namespace taptiles {

// split on ' ' dropping trailing empty tokens, other empty tokens are kept
static std::vector<std::string> split_spaces(const std::string &text){
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        size_t p = text.find(' ', start);
        if (p == std::string::npos) {
            tokens.push_back(text.substr(start));
            break;
        }
        tokens.push_back(text.substr(start, p - start));
        start = p + 1;
    }
    while (!tokens.empty() && tokens.back().empty()) tokens.pop_back();
    return tokens;
}

// digits only, any length. The value saturates at `limit` so long tokens cannot overflow
static bool parse_index(const std::string &tok, long limit, long &out){
    if (tok.empty()) return false;
    long v = 0;
    for (char c : tok) {
        if (c < '0' || c > '9') return false;
        if (v < limit) v = std::min(limit, v * 10 + (c - '0'));
    }
    out = v;
    return true;
}

SheetParseResult parse_sheet(const std::string &text, int note_count){
    SheetParseResult res;
    std::vector<std::string> tokens = split_spaces(text);
    if (tokens.empty()) {
        res.error = "sheet has no notes";
        return res;
    }
    for (size_t i = 0; i < tokens.size(); ++i) {
        long v = 0;
        if (!parse_index(tokens[i], note_count, v)) {
            res.error = "token " + std::to_string(i) + " '" + tokens[i] + "' is not a note index";
            res.notes.clear();
            return res;
        }
        if (v >= note_count) {
            res.error = "note '" + tokens[i] + "' out of range (" + std::to_string(note_count) + " notes)";
            res.notes.clear();
            return res;
        }
        res.notes.push_back(static_cast<int>(v));
    }
    res.ok = true;
    return res;
}

SheetParseResult NoteSheet::load(const std::vector<uint8_t> &data, const std::string &filename, int note_count){
    std::string text(data.begin(), data.end());
    SheetParseResult res = parse_sheet(text, note_count);
    if (!res.ok) {
        std::cerr << "[sheet] failed to parse " << filename << ": " << res.error << "\n";
        clear();
        return res;
    }
    notes_ = res.notes;
    filename_ = filename;
    loaded_ = true;
    std::cerr << "[sheet] loaded " << filename << " (" << notes_.size() << " notes)\n";
    return res;
}

void NoteSheet::clear(){
    notes_.clear();
    filename_.clear();
    loaded_ = false;
}

std::string NoteSheet::status_text() const {
    if (loaded_) return "Loaded " + filename_;
    return "No sheet loaded";
}

int NoteSheet::note_for_score(int score) const {
    if (notes_.empty()) return -1;
    int n = static_cast<int>(notes_.size());
    int idx = ((score - 1) % n + n) % n;
    return notes_[idx];
}

} // namespace taptiles
