#include "multiqr_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

static void print_usage(const char* prog) {
    std::cerr << "Usage:" << std::endl;
    std::cerr << "  " << prog << " encode [-i text.txt] [-o out.png] [-c chunk_size] [-p passphrase] [--base64] [--no-labels]" << std::endl;
    std::cerr << "  " << prog << " decode -i image.png [-p passphrase]" << std::endl;
    std::cerr << "Text is read from stdin and PNG written to stdout when -i / -o are omitted." << std::endl;
    std::cerr << "The passphrase falls back to $MULTIQR_PASSPHRASE." << std::endl;
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

struct CliOptions {
    std::string command;
    std::string input;
    std::string output;
    std::optional<std::string> passphrase;
    bool base64 = false;
    CodecConfig config;
};

// Returns false on a usage error.
static bool parse_args(int argc, char** argv, CliOptions& opts) {
    if (argc < 2) return false;
    opts.command = argv[1];
    if (opts.command != "encode" && opts.command != "decode") return false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if ((arg == "-i" || arg == "--input") && has_value) {
            opts.input = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && has_value) {
            opts.output = argv[++i];
        } else if ((arg == "-p" || arg == "--passphrase") && has_value) {
            opts.passphrase = argv[++i];
        } else if ((arg == "-c" || arg == "--chunk-size") && has_value) {
            try {
                opts.config.chunk_size = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid chunk size: " << argv[i] << std::endl;
                return false;
            }
        } else if (arg == "--base64") {
            opts.base64 = true;
        } else if (arg == "--no-labels") {
            opts.config.add_labels = false;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            return false;
        }
    }

    if (!opts.passphrase) {
        if (const char* env = std::getenv("MULTIQR_PASSPHRASE")) opts.passphrase = std::string(env);
    }
    if (opts.passphrase) {
        std::string p = trim(*opts.passphrase);
        if (p.empty()) opts.passphrase.reset();
        else opts.passphrase = p;
    }

    if (opts.command == "decode" && opts.input.empty()) {
        std::cerr << "decode needs -i <image>" << std::endl;
        return false;
    }
    return true;
}

static int run_encode(const CliOptions& opts, const MultiQrCodec& codec) {
    std::string text;
    if (opts.input.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(opts.input, std::ios::binary);
        if (!in) {
            std::cerr << "[ENCODE] Cannot open " << opts.input << std::endl;
            return 1;
        }
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    try {
        std::string out;
        if (opts.base64) {
            out = codec.encode_base64(text, opts.config.chunk_size, opts.passphrase);
            out += '\n';
        } else {
            std::vector<uint8_t> png = codec.encode(text, opts.config.chunk_size, opts.passphrase);
            out.assign(png.begin(), png.end());
        }

        if (opts.output.empty()) {
            std::cout.write(out.data(), static_cast<std::streamsize>(out.size()));
            std::cout.flush();
        } else {
            std::ofstream f(opts.output, std::ios::binary);
            if (!f.write(out.data(), static_cast<std::streamsize>(out.size()))) {
                std::cerr << "[ENCODE] Cannot write " << opts.output << std::endl;
                return 1;
            }
            std::cerr << "[ENCODE] Wrote " << out.size() << " bytes to " << opts.output << std::endl;
        }
    } catch (const CodecError& e) {
        std::cerr << "[ENCODE] Failed (" << error_kind_name(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

static int run_decode(const CliOptions& opts, const MultiQrCodec& codec) {
    DecodeResult result = codec.decode_file(opts.input, opts.passphrase);

    json out;
    out["sha256"] = result.sha256 ? json(*result.sha256) : json(nullptr);
    if (result.ok()) {
        out["data"] = *result.text;
    } else {
        out["error"] = result.message;
        out["kind"] = error_kind_name(result.error);
        out["missing"] = result.missing;
    }

    std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return result.ok() ? 0 : 1;
}

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        MultiQrCodec codec(opts.config);
        if (opts.command == "encode") return run_encode(opts, codec);
        return run_decode(opts, codec);
    } catch (const std::exception& e) {
        std::cerr << "[MULTIQR] Exception: " << e.what() << std::endl;
        return 1;
    }
}
