#include "wav.hpp"
#include "stegwave/dsp.hpp"
#include "stegwave/logging.hpp"
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

namespace stegwave {
namespace io {

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_IEEE_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return p[0] | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void writeU16(std::ofstream& file, uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>(v >> 8)};
    file.write(b, 2);
}

void writeU32(std::ofstream& file, uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                       static_cast<char>((v >> 16) & 0xFF), static_cast<char>(v >> 24)};
    file.write(b, 4);
}

[[noreturn]] void fail(const std::string& filename, const std::string& reason) {
    throw std::runtime_error(filename + ": " + reason);
}

// One frame's first channel -> int16
Sample convertSample(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == FORMAT_IEEE_FLOAT) {
        uint32_t raw = readU32(p);
        float f;
        std::memcpy(&f, &raw, sizeof(f));
        return dsp::toPcm16(static_cast<Real>(f) * 32767.0);
    }
    switch (bits) {
        case 8:  return static_cast<Sample>((static_cast<int>(p[0]) - 128) * 256);
        case 16: return static_cast<Sample>(readU16(p));
        case 24: return static_cast<Sample>(readU16(p + 1));
        case 32: return static_cast<Sample>(readU16(p + 2));
        default: return 0;
    }
}

} // namespace

WavAudio readWav(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        fail(filename, "cannot open for reading");
    }

    uint8_t riff[12];
    if (!file.read(reinterpret_cast<char*>(riff), sizeof(riff)) ||
        std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        fail(filename, "not a valid WAV file");
    }

    uint16_t format = 0, channels = 0, bits_per_sample = 0, block_align = 0;
    uint32_t sample_rate = 0;
    bool have_fmt = false;

    // Walk chunks until "data"
    uint8_t chunk_header[8];
    while (file.read(reinterpret_cast<char*>(chunk_header), sizeof(chunk_header))) {
        const uint32_t chunk_size = readU32(chunk_header + 4);

        if (std::memcmp(chunk_header, "fmt ", 4) == 0) {
            if (chunk_size < 16) fail(filename, "fmt chunk too short");
            std::vector<uint8_t> fmt(chunk_size + (chunk_size & 1));
            if (!file.read(reinterpret_cast<char*>(fmt.data()), fmt.size())) {
                fail(filename, "truncated fmt chunk");
            }
            format = readU16(&fmt[0]);
            channels = readU16(&fmt[2]);
            sample_rate = readU32(&fmt[4]);
            block_align = readU16(&fmt[12]);
            bits_per_sample = readU16(&fmt[14]);
            // WAVE_FORMAT_EXTENSIBLE: real format is the first word of the sub-format GUID
            if (format == FORMAT_EXTENSIBLE && chunk_size >= 26) {
                format = readU16(&fmt[24]);
            }
            have_fmt = true;
        } else if (std::memcmp(chunk_header, "data", 4) == 0) {
            if (!have_fmt) fail(filename, "data chunk before fmt chunk");
            if (format != FORMAT_PCM && format != FORMAT_IEEE_FLOAT) {
                fail(filename, "unsupported format tag " + std::to_string(format));
            }
            if (format == FORMAT_IEEE_FLOAT && bits_per_sample != 32) {
                fail(filename, "unsupported float depth " + std::to_string(bits_per_sample));
            }
            if (bits_per_sample != 8 && bits_per_sample != 16 &&
                bits_per_sample != 24 && bits_per_sample != 32) {
                fail(filename, "unsupported bit depth " + std::to_string(bits_per_sample));
            }
            if (channels == 0 || block_align < channels * (bits_per_sample / 8)) {
                fail(filename, "inconsistent fmt chunk");
            }

            std::vector<uint8_t> data(chunk_size);
            file.read(reinterpret_cast<char*>(data.data()), data.size());
            const size_t got = static_cast<size_t>(file.gcount());
            if (got < data.size()) {
                LOG_WARN("WAV", "%s: data chunk truncated (%zu of %u bytes)",
                         filename.c_str(), got, chunk_size);
            }

            WavAudio audio;
            audio.sample_rate = sample_rate;
            audio.source_channels = channels;
            audio.source_bits = bits_per_sample;

            const size_t frames = got / block_align;
            audio.samples.resize(frames);
            for (size_t i = 0; i < frames; ++i) {
                audio.samples[i] = convertSample(&data[i * block_align], format, bits_per_sample);
            }

            if (channels > 1) {
                LOG_INFO("WAV", "%s: %u channels reduced to mono (first channel)",
                         filename.c_str(), channels);
            }
            LOG_DEBUG("WAV", "Read %s: %zu samples @ %u Hz, %u-bit",
                      filename.c_str(), audio.samples.size(), sample_rate, bits_per_sample);
            return audio;
        } else {
            file.seekg(chunk_size + (chunk_size & 1), std::ios::cur);
        }
    }

    fail(filename, "no data chunk found");
}

void writeWav(const std::string& filename, const WavAudio& audio) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        fail(filename, "cannot open for writing");
    }

    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint32_t data_size = static_cast<uint32_t>(audio.samples.size() * sizeof(int16_t));
    const uint32_t byte_rate = audio.sample_rate * channels * bits_per_sample / 8;
    const uint16_t block_align = channels * bits_per_sample / 8;

    file.write("RIFF", 4);
    writeU32(file, 36 + data_size);
    file.write("WAVE", 4);
    file.write("fmt ", 4);
    writeU32(file, 16);
    writeU16(file, FORMAT_PCM);
    writeU16(file, channels);
    writeU32(file, audio.sample_rate);
    writeU32(file, byte_rate);
    writeU16(file, block_align);
    writeU16(file, bits_per_sample);
    file.write("data", 4);
    writeU32(file, data_size);
    for (Sample s : audio.samples) {
        writeU16(file, static_cast<uint16_t>(s));
    }

    if (!file) {
        fail(filename, "write failed");
    }

    LOG_DEBUG("WAV", "Wrote %s: %zu samples @ %u Hz",
              filename.c_str(), audio.samples.size(), audio.sample_rate);
}

} // namespace io
} // namespace stegwave
