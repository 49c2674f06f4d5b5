// Generate a synthetic carrier WAV for trying out the encoder
// Creates a tone mix with a low noise floor, mono 16-bit PCM
//
// Usage: ./generate_test_carrier <output.wav> [seconds] [sample_rate]

#define _USE_MATH_DEFINES
#include <cmath>
#include <iostream>
#include <cstdlib>
#include <random>

#include "io/wav.hpp"
#include "stegwave/dsp.hpp"
#include "stegwave/stego.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

constexpr double NOISE_LEVEL = 600.0;     // Noise floor (PCM units)
constexpr double TONE_LEVEL = 4000.0;     // Per-tone amplitude

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Generate a synthetic carrier for stegwave\n\n";
        std::cerr << "Usage:\n";
        std::cerr << "  " << argv[0] << " <output.wav> [seconds=10] [sample_rate=44100]\n";
        return 1;
    }

    const double seconds = argc > 2 ? std::atof(argv[2]) : 10.0;
    const uint32_t sample_rate = argc > 3 ? static_cast<uint32_t>(std::atoi(argv[3])) : 44100;
    if (seconds <= 0 || sample_rate == 0) {
        std::cerr << "Error: duration and sample rate must be positive\n";
        return 1;
    }

    std::mt19937 rng(42);  // Fixed seed for reproducibility
    std::normal_distribution<double> noise(0.0, NOISE_LEVEL);

    const size_t n = static_cast<size_t>(seconds * sample_rate);
    const double tones[] = {220.0, 330.0, 440.0, 1250.0};

    stegwave::io::WavAudio audio;
    audio.sample_rate = sample_rate;
    audio.samples.resize(n);
    for (size_t i = 0; i < n; ++i) {
        double t = static_cast<double>(i) / sample_rate;
        double v = noise(rng);
        for (double f : tones) {
            v += TONE_LEVEL * std::sin(2.0 * M_PI * f * t);
        }
        audio.samples[i] = stegwave::dsp::toPcm16(v);
    }

    try {
        stegwave::io::writeWav(argv[1], audio);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Wrote " << argv[1] << ": " << n << " samples, " << seconds << " s @ "
              << sample_rate << " Hz\n";
    for (auto id : {stegwave::AlgorithmId::LSB, stegwave::AlgorithmId::ECHO,
                    stegwave::AlgorithmId::PHASE, stegwave::AlgorithmId::DSSS}) {
        std::cout << "  " << stegwave::algorithmIdToString(id) << " capacity: "
                  << stegwave::capacityBytes(stegwave::presets::forAlgorithm(id), n) << " bytes\n";
    }
    return 0;
}
