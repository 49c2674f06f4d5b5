#include "file_type.hpp"
#include <algorithm>
#include <cstring>

namespace stegwave {
namespace payload {

namespace {

struct MagicEntry {
    const char* magic;
    size_t length;
    FileType type;
};

// First match wins
constexpr MagicEntry MAGIC_TABLE[] = {
    {"\x89PNG",             4, {".png", "PNG Image"}},
    {"\xFF\xD8\xFF",        3, {".jpg", "JPEG Image"}},
    {"GIF87a",              6, {".gif", "GIF Image"}},
    {"GIF89a",              6, {".gif", "GIF Image"}},
    {"%PDF",                4, {".pdf", "PDF Document"}},
    {"PK\x03\x04",          4, {".zip", "ZIP Archive"}},
    {"PK\x05\x06",          4, {".zip", "ZIP Archive (empty)"}},
    {"Rar!\x1A\x07",        6, {".rar", "RAR Archive"}},
    {"RIFF",                4, {".wav", "WAV Audio"}},
    {"\x00\x00\x00\x1C",    4, {".mp4", "MP4 Video"}},
    {"\x00\x00\x00\x20",    4, {".mp4", "MP4 Video"}},
    {"ID3",                 3, {".mp3", "MP3 Audio"}},
    {"\xFF\xFB",            2, {".mp3", "MP3 Audio"}},
    {"\x1F\x8B",            2, {".gz",  "GZIP Archive"}},
    {"BM",                  2, {".bmp", "BMP Image"}},
    {"\x00\x00\x01\x00",    4, {".ico", "ICO Icon"}},
    {"MZ",                  2, {".exe", "Windows Executable"}},
    {"\x7F" "ELF",          4, {".elf", "Linux Executable"}},
};

constexpr size_t TEXT_PROBE_BYTES = 100;

bool isTextByte(uint8_t b) {
    return (b >= 32 && b < 127) || b == '\t' || b == '\n' || b == '\r';
}

} // namespace

FileType detectFileType(ByteSpan data) {
    if (data.size() < 2) return BINARY_FILE;

    for (const auto& entry : MAGIC_TABLE) {
        if (data.size() >= entry.length &&
            std::memcmp(data.data(), entry.magic, entry.length) == 0) {
            return entry.type;
        }
    }

    auto probe = data.first(std::min(data.size(), TEXT_PROBE_BYTES));
    if (std::all_of(probe.begin(), probe.end(), isTextByte)) {
        return {".txt", "Text File"};
    }

    return BINARY_FILE;
}

} // namespace payload
} // namespace stegwave
