#ifndef TAPTILES_AUDIO_H
#define TAPTILES_AUDIO_H

#include <SDL.h>
#include <cstdint>
#include <string>
#include <vector>

// Plays one of the preloaded note samples through an SDL audio queue.
// Samples are converted to the device format once at load time.
class NotePlayer {
public:
    NotePlayer() = default;
    ~NotePlayer() { shutdown(); }
    NotePlayer(const NotePlayer&) = delete;
    NotePlayer& operator=(const NotePlayer&) = delete;

    // opens the default device and loads every note file from `dir`.
    // Returns false if the device could not be opened; missing files are skipped.
    bool init(const std::string& dir, int note_count);
    void shutdown();

    // restarts playback with note `index`; unknown or unloaded notes are ignored
    void play(int index);

    int loaded_count() const;

private:
    bool load_note(const std::string& path, std::vector<uint8_t>& out);

    SDL_AudioDeviceID dev_ = 0;
    SDL_AudioSpec have_{};
    std::vector<std::vector<uint8_t>> notes_;
};

// sample file for a note index, empty when out of range
std::string NoteFileName(int index);

#endif // TAPTILES_AUDIO_H
