#pragma once

#include "ronin/Types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ronin {

// Signed 16-bit PCM, interleaved when channels > 1.
struct Waveform {
    int sampleRate = 0;
    int channels = 0;
    std::vector<int16_t> samples;

    size_t frames() const { return channels ? samples.size() / (size_t)channels : 0; }
    float durationSeconds() const { return sampleRate ? (float)frames() / (float)sampleRate : 0.0f; }
    bool operator==(const Waveform &o) const { return sampleRate == o.sampleRate && channels == o.channels && samples == o.samples; }
};

enum class VoiceShape { Sine, Square, Noise };

struct Voice {
    VoiceShape shape = VoiceShape::Sine;
    float frequency = 440;          // start frequency, Hz
    float slide = 0;                // Hz added linearly by the end
    float duration = 0.1f;
    float volume = 0.5f;
    bool pitchDrop = false;         // noise only: sample-and-hold period grows over time
    uint32_t noiseSeed = 0;
};

// Stateless: the same event always yields the same buffer.
class AudioSynth {
public:
    AudioSynth(int sampleRate=22050, int channels=2, float volume=0.5f) : rate(sampleRate), chans(channels), vol(volume) {}

    Waveform synthesize(SoundEvent e) const { return render(voiceFor(e)); }
    Voice voiceFor(SoundEvent e) const;
    Waveform render(const Voice &v) const;

    int sampleRate() const { return rate; }
    int channels() const { return chans; }

private:
    int rate;
    int chans;
    float vol;
};

// One synthesized buffer per event kind, built on first use or up front.
class SoundBank {
public:
    explicit SoundBank(const AudioSynth &synth) : synth(synth) { ready.fill(false); }

    void precompute();
    const Waveform &get(SoundEvent e);
    size_t synthesizedCount() const { return synthCalls; }

private:
    AudioSynth synth;
    std::array<Waveform, (size_t)SoundEvent::Count> cache;
    std::array<bool, (size_t)SoundEvent::Count> ready;
    size_t synthCalls = 0;
};

} // namespace ronin
