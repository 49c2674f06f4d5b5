#include "stegwave/stego.hpp"
#include "stegwave/dsp.hpp"
#include "stegwave/logging.hpp"
#include "io/wav.hpp"
#include "payload/file_type.hpp"

#include <iostream>
#include <fstream>
#include <cstring>
#include <cstdlib>
#include <iterator>
#include <string>

namespace {

struct Options {
    std::string command;
    std::string input;
    std::string payload;
    std::string output;
    stegwave::AlgorithmId algorithm = stegwave::AlgorithmId::LSB;
    stegwave::EchoParams echo;
};

bool parseAlgorithm(const char* s, stegwave::AlgorithmId& out) {
    if (strcmp(s, "lsb") == 0)   { out = stegwave::AlgorithmId::LSB;   return true; }
    if (strcmp(s, "echo") == 0)  { out = stegwave::AlgorithmId::ECHO;  return true; }
    if (strcmp(s, "phase") == 0) { out = stegwave::AlgorithmId::PHASE; return true; }
    if (strcmp(s, "dsss") == 0)  { out = stegwave::AlgorithmId::DSSS;  return true; }
    return false;
}

void printUsage(const char* prog) {
    std::cerr << "StegWave - Audio Steganography\n\n";
    std::cerr << "Usage: " << prog << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  encode          Hide a payload file in a WAV carrier\n";
    std::cerr << "  decode          Recover the payload from a stego WAV\n";
    std::cerr << "  capacity        Show how many bytes a carrier can hold\n";
    std::cerr << "  info            Show the header of a stego WAV\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -i <file>       Input WAV (carrier or stego)\n";
    std::cerr << "  -p <file>       Payload file (encode)\n";
    std::cerr << "  -o <file>       Output file (encode: WAV, decode: payload)\n";
    std::cerr << "  -a <algo>       Algorithm: lsb, echo, phase, dsss (default: lsb)\n";
    std::cerr << "  --chunk <n>     Echo chunk size, power of 2 in 256..8192 (default: 2048)\n";
    std::cerr << "  --d0 <n>        Echo delay for bit 0, 10..500 (default: 50)\n";
    std::cerr << "  --d1 <n>        Echo delay for bit 1, 50..1000 (default: 200)\n";
    std::cerr << "  --alpha <x>     Echo strength, 0.1..1.0 (default: 0.5)\n";
    std::cerr << "  -v              Verbose (debug) logging\n";
    std::cerr << "  -q              Quiet, errors only\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " encode -i song.wav -p secret.png -o stego.wav -a phase\n";
    std::cerr << "  " << prog << " decode -i stego.wav\n";
}

stegwave::AlgorithmParams selectedParams(const Options& opts) {
    if (opts.algorithm == stegwave::AlgorithmId::ECHO) {
        return opts.echo;
    }
    return stegwave::presets::forAlgorithm(opts.algorithm);
}

stegwave::Bytes readFile(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error(filename + ": cannot open for reading");
    }
    return stegwave::Bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void writeFile(const std::string& filename, const stegwave::Bytes& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error(filename + ": cannot open for writing");
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error(filename + ": write failed");
    }
}

void printParams(const stegwave::Header& header) {
    using stegwave::AlgorithmId;
    const auto& p = header.params;
    switch (header.algorithm) {
        case AlgorithmId::LSB:
            std::cout << "  Parameters:     none\n";
            break;
        case AlgorithmId::ECHO:
            std::cout << "  Chunk size:     " << p[0] << " samples\n";
            std::cout << "  Delay 0 / 1:    " << p[1] << " / " << p[2] << " samples\n";
            break;
        case AlgorithmId::PHASE:
            std::cout << "  Segment size:   " << p[0] << " samples\n";
            std::cout << "  Bins:           " << p[1] << ".." << (p[1] + p[2] - 1) << "\n";
            break;
        case AlgorithmId::DSSS:
            std::cout << "  Frame size:     " << p[0] << " samples\n";
            std::cout << "  Seed / alpha:   " << p[1] << " / " << p[2] << "\n";
            break;
    }
}

int runEncode(const Options& opts) {
    if (opts.input.empty() || opts.payload.empty() || opts.output.empty()) {
        std::cerr << "Error: encode needs -i, -p and -o\n";
        return 2;
    }

    auto carrier = stegwave::io::readWav(opts.input);
    auto payload = readFile(opts.payload);
    auto params = selectedParams(opts);

    auto stego = stegwave::encode(carrier.samples, payload, params);

    stegwave::io::WavAudio out;
    out.sample_rate = carrier.sample_rate;
    out.samples = std::move(stego);
    stegwave::io::writeWav(opts.output, out);

    std::cout << "Embedded " << payload.size() << " bytes with "
              << stegwave::algorithmIdToString(stegwave::algorithmOf(params))
              << " into " << opts.output << "\n";
    std::cout << "  Capacity used:  " << payload.size() << " / "
              << stegwave::capacityBytes(params, carrier.samples.size()) << " bytes\n";
    std::cout << "  Carrier SNR:    "
              << stegwave::dsp::snrDb(carrier.samples, out.samples) << " dB\n";
    return 0;
}

int runDecode(const Options& opts) {
    if (opts.input.empty()) {
        std::cerr << "Error: decode needs -i\n";
        return 2;
    }

    auto audio = stegwave::io::readWav(opts.input);
    auto result = stegwave::decode(audio.samples);

    auto type = stegwave::payload::detectFileType(result.payload);
    std::string output = opts.output.empty() ? std::string("decoded") + type.extension : opts.output;
    writeFile(output, result.payload);

    std::cout << "Recovered " << result.payload.size() << " bytes ("
              << stegwave::algorithmIdToString(result.algorithm) << ")\n";
    std::cout << "  Detected type:  " << type.description << " (" << type.extension << ")\n";
    std::cout << "  Saved to:       " << output << "\n";
    return 0;
}

int runCapacity(const Options& opts) {
    if (opts.input.empty()) {
        std::cerr << "Error: capacity needs -i\n";
        return 2;
    }

    auto audio = stegwave::io::readWav(opts.input);
    const size_t n = audio.samples.size();

    std::cout << "Carrier: " << opts.input << " | " << audio.sample_rate << " Hz | "
              << (static_cast<double>(n) / audio.sample_rate) << " s | "
              << n << " samples\n\n";

    for (auto id : {stegwave::AlgorithmId::LSB, stegwave::AlgorithmId::ECHO,
                    stegwave::AlgorithmId::PHASE, stegwave::AlgorithmId::DSSS}) {
        Options per = opts;
        per.algorithm = id;
        auto params = selectedParams(per);
        const size_t bytes = stegwave::capacityBytes(params, n);
        std::cout << "  " << stegwave::algorithmIdToString(id) << ":\t"
                  << bytes << " bytes (" << (bytes / 1024.0) << " KB)\n";
    }
    return 0;
}

int runInfo(const Options& opts) {
    if (opts.input.empty()) {
        std::cerr << "Error: info needs -i\n";
        return 2;
    }

    auto audio = stegwave::io::readWav(opts.input);
    auto header = stegwave::readHeader(audio.samples);

    std::cout << "=== StegWave Header ===\n\n";
    std::cout << "  Algorithm:      " << stegwave::algorithmIdToString(header.algorithm)
              << " (" << static_cast<int>(header.algorithm) << ")\n";
    printParams(header);
    std::cout << "  Payload:        " << header.payload_len << " bytes\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    Options opts;
    opts.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (strcmp(arg, "-i") == 0 && has_value) {
            opts.input = argv[++i];
        } else if (strcmp(arg, "-p") == 0 && has_value) {
            opts.payload = argv[++i];
        } else if (strcmp(arg, "-o") == 0 && has_value) {
            opts.output = argv[++i];
        } else if (strcmp(arg, "-a") == 0 && has_value) {
            if (!parseAlgorithm(argv[++i], opts.algorithm)) {
                std::cerr << "Error: unknown algorithm '" << argv[i] << "'\n";
                return 2;
            }
        } else if (strcmp(arg, "--chunk") == 0 && has_value) {
            opts.echo.chunk_size = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (strcmp(arg, "--d0") == 0 && has_value) {
            opts.echo.delay0 = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (strcmp(arg, "--d1") == 0 && has_value) {
            opts.echo.delay1 = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (strcmp(arg, "--alpha") == 0 && has_value) {
            opts.echo.alpha = std::strtod(argv[++i], nullptr);
        } else if (strcmp(arg, "-v") == 0) {
            stegwave::setLogLevel(stegwave::LogLevel::DEBUG);
        } else if (strcmp(arg, "-q") == 0) {
            stegwave::setLogLevel(stegwave::LogLevel::ERROR);
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    try {
        if (opts.command == "encode")   return runEncode(opts);
        if (opts.command == "decode")   return runDecode(opts);
        if (opts.command == "capacity") return runCapacity(opts);
        if (opts.command == "info")     return runInfo(opts);
    } catch (const stegwave::StegoError& e) {
        LOG_ERROR("STEGO", "%s", e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("MAIN", "%s", e.what());
        return 1;
    }

    std::cerr << "Error: unknown command '" << opts.command << "'\n";
    printUsage(argv[0]);
    return 2;
}
