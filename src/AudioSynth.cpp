#include "ronin/AudioSynth.h"

#include <cmath>
#include <random>

using namespace std;

namespace ronin {

static const double kTwoPi = 6.28318530717958647692;

const char *soundEventName(SoundEvent e) {
    switch(e) {
    case SoundEvent::Jump: return "jump";
    case SoundEvent::DoubleJump: return "double_jump";
    case SoundEvent::PowerUp: return "powerup";
    case SoundEvent::Tornado: return "tornado";
    case SoundEvent::Milestone: return "milestone";
    case SoundEvent::Hit: return "hit";
    case SoundEvent::Count: break;
    }
    return "?";
}

Voice AudioSynth::voiceFor(SoundEvent e) const {
    Voice v;
    v.volume = vol;
    v.noiseSeed = 0x5EED0000u + (uint32_t)e;
    switch(e) {
    case SoundEvent::Jump:       v.shape = VoiceShape::Square; v.frequency = 440; v.slide = 100; v.duration = 0.10f; break;
    case SoundEvent::DoubleJump: v.shape = VoiceShape::Sine;   v.frequency = 660; v.slide = 200; v.duration = 0.10f; break;
    case SoundEvent::PowerUp:    v.shape = VoiceShape::Sine;   v.frequency = 554; v.slide = 120; v.duration = 0.12f; break;
    case SoundEvent::Milestone:  v.shape = VoiceShape::Sine;   v.frequency = 880; v.slide = 0;   v.duration = 0.05f; break;
    case SoundEvent::Tornado:    v.shape = VoiceShape::Noise;  v.duration = 0.15f; break;
    case SoundEvent::Hit:        v.shape = VoiceShape::Noise;  v.duration = 0.30f; v.pitchDrop = true; break;
    case SoundEvent::Count:      v.duration = 0; break;
    }
    return v;
}

Waveform AudioSynth::render(const Voice &v) const {
    Waveform w;
    w.sampleRate = rate;
    w.channels = chans;
    size_t n = v.duration > 0 ? (size_t)(rate * v.duration) : 0;
    w.samples.resize(n * (size_t)chans);

    // A local engine keeps noise voices reproducible call after call.
    minstd_rand noise(v.noiseSeed ? v.noiseSeed : 1u);
    uniform_real_distribution<float> uni(-1.0f, 1.0f);
    double phase = 0;
    float held = 0;
    size_t holdLeft = 0;

    for(size_t i=0;i<n;++i) {
        float t = (float)i / (float)n;
        float s = 0;
        if(v.shape == VoiceShape::Noise) {
            if(!v.pitchDrop) s = uni(noise);
            else {
                if(holdLeft == 0) { held = uni(noise); holdLeft = 1 + (size_t)(t * 8.0f); }
                --holdLeft;
                s = held;
            }
        } else {
            double f = v.frequency + v.slide * t;
            phase += kTwoPi * f / rate;
            if(phase >= kTwoPi) phase -= kTwoPi;
            double sn = sin(phase);
            s = v.shape == VoiceShape::Square ? (sn > 0 ? 1.0f : (sn < 0 ? -1.0f : 0.0f)) : (float)sn;
        }
        float env = 1.0f - t;
        int sample = (int)lrintf(s * env * v.volume * 32767.0f);
        if(sample > 32767) sample = 32767;
        if(sample < -32768) sample = -32768;
        for(int c=0;c<chans;++c) w.samples[i * (size_t)chans + (size_t)c] = (int16_t)sample;
    }
    return w;
}

// ------------------------------ SoundBank ---------------------------------

void SoundBank::precompute() {
    for(size_t i=0;i<(size_t)SoundEvent::Count;++i) get((SoundEvent)i);
}

const Waveform &SoundBank::get(SoundEvent e) {
    size_t i = (size_t)e;
    if(!ready[i]) {
        cache[i] = synth.synthesize(e);
        ready[i] = true;
        synthCalls++;
    }
    return cache[i];
}

} // namespace ronin
