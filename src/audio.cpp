#include "audio.h"
#include <array>
#include <cstring>
#include <iostream>

// file names as shipped in assets/audio (two a#/g#7 samples share the 21 prefix)
static const std::array<const char*, 24> kNoteFiles = {
    "01_c6.wav", "02_c#6.wav", "03_d6.wav",
    "04_d#6.wav", "05_e6.wav", "06_f6.wav",
    "07_f#6.wav", "08_g6.wav", "09_g#6.wav",
    "10_a6.wav", "11_a#6.wav", "12_b6.wav",
    "13_c7.wav", "14_c#7.wav", "15_d7.wav",
    "16_d#7.wav", "17_e7.wav", "18_f7.wav",
    "19_f#7.wav", "20_g7.wav", "21_a#7.wav",
    "21_g#7.wav", "22_a7.wav", "23_b7.wav"
};

std::string NoteFileName(int index) {
    if (index < 0 || index >= static_cast<int>(kNoteFiles.size())) return std::string();
    return kNoteFiles[index];
}

bool NotePlayer::init(const std::string& dir, int note_count) {
    shutdown();

    SDL_AudioSpec want{};
    want.freq = 44100;
    want.format = AUDIO_S16SYS;
    want.channels = 2;
    want.samples = 1024;
    want.callback = nullptr; // queued playback

    dev_ = SDL_OpenAudioDevice(nullptr, 0, &want, &have_, 0);
    if (!dev_) {
        std::cerr << "NotePlayer: SDL_OpenAudioDevice failed: " << SDL_GetError() << "\n";
        return false;
    }

    notes_.assign(note_count > 0 ? note_count : 0, std::vector<uint8_t>());
    for (int i = 0; i < static_cast<int>(notes_.size()); ++i) {
        std::string name = NoteFileName(i);
        if (name.empty()) continue;
        if (!load_note(dir + name, notes_[i])) {
            std::cerr << "NotePlayer: could not load " << dir << name << ": " << SDL_GetError() << "\n";
        }
    }
    std::cerr << "NotePlayer: loaded " << loaded_count() << "/" << notes_.size() << " notes\n";

    SDL_PauseAudioDevice(dev_, 0);
    return true;
}

bool NotePlayer::load_note(const std::string& path, std::vector<uint8_t>& out) {
    SDL_AudioSpec spec{};
    Uint8* buf = nullptr;
    Uint32 len = 0;
    if (!SDL_LoadWAV(path.c_str(), &spec, &buf, &len)) return false;

    SDL_AudioCVT cvt;
    int rc = SDL_BuildAudioCVT(&cvt, spec.format, spec.channels, spec.freq,
                               have_.format, have_.channels, have_.freq);
    if (rc < 0) {
        SDL_FreeWAV(buf);
        return false;
    }
    if (rc == 0) {
        out.assign(buf, buf + len);
        SDL_FreeWAV(buf);
        return true;
    }

    // conversion needs len * len_mult bytes of working space
    std::vector<uint8_t> work(static_cast<size_t>(len) * cvt.len_mult);
    std::memcpy(work.data(), buf, len);
    SDL_FreeWAV(buf);
    cvt.buf = work.data();
    cvt.len = static_cast<int>(len);
    if (SDL_ConvertAudio(&cvt) != 0) return false;
    work.resize(cvt.len_cvt);
    out.swap(work);
    return true;
}

void NotePlayer::shutdown() {
    if (dev_) {
        SDL_CloseAudioDevice(dev_);
        dev_ = 0;
    }
    notes_.clear();
}

void NotePlayer::play(int index) {
    if (!dev_) return;
    if (index < 0 || index >= static_cast<int>(notes_.size())) return;
    const auto& pcm = notes_[index];
    if (pcm.empty()) return;
    SDL_ClearQueuedAudio(dev_);
    if (SDL_QueueAudio(dev_, pcm.data(), static_cast<Uint32>(pcm.size())) != 0) {
        std::cerr << "NotePlayer: SDL_QueueAudio failed: " << SDL_GetError() << "\n";
    }
}

int NotePlayer::loaded_count() const {
    int n = 0;
    for (const auto& s : notes_) if (!s.empty()) n++;
    return n;
}
