#include "nbtcodec/nbt.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

void usage() {
    std::cerr <<
        "nbt_dump - NBT inspector\n"
        "\n"
        "Usage:\n"
        "  nbt_dump show    <FILE> [--pretty] [--quote-keys] [--max-depth N]\n"
        "  nbt_dump convert <FILE> <OUT> [--compression none|gzip|zlib] [--max-depth N]\n"
        "  nbt_dump encode  <SNBT_FILE> <OUT> [--compression none|gzip|zlib] [--max-depth N]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string out;
    bool pretty{false};
    bool quote_keys{false};
    std::size_t max_depth{nbtcodec::DEFAULT_MAX_DEPTH};
    nbtcodec::CompressionScheme compression{nbtcodec::NOTHING};
};

bool parse_compression(const std::string& name, nbtcodec::CompressionScheme& out) {
    if (name == "none") out = nbtcodec::NOTHING;
    else if (name == "gzip") out = nbtcodec::GZIP;
    else if (name == "zlib") out = nbtcodec::ZLIB;
    else return false;
    return true;
}

bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    if (a.cmd == "convert" || a.cmd == "encode") {
        if (i >= argc) return false;
        a.out = argv[i++];
    } else if (a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--pretty") a.pretty = true;
        else if (opt == "--quote-keys") a.quote_keys = true;
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--compression" && i < argc) {
            std::string name = argv[i++];
            if (!parse_compression(name, a.compression)) {
                std::cerr << "Unknown compression: " << name << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }
    return true;
}

}

int main(int argc, char** argv) {
    Args a;
    try {
        if (!parse_args(argc, argv, a)) {
            usage();
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad argument: " << e.what() << "\n";
        usage();
        return 2;
    }

    nbtcodec::SnbtConfig config;
    config.pretty_print = a.pretty;
    config.force_quote_keys = a.quote_keys;
    nbtcodec::Nbt nbt{nbtcodec::TypeRegistry(), config, a.max_depth};

    try {
        if (a.cmd == "show") {
            std::cout << nbt.to_snbt(nbt.from_file(a.file)) << "\n";
            return 0;
        }
        if (a.cmd == "convert") {
            nbt.to_file(nbt.from_file(a.file), a.out, a.compression);
            std::cout << "Wrote: " << a.out << " (" << nbtcodec::get_compression_name(a.compression) << ")\n";
            return 0;
        }
        std::ifstream input(a.file);
        if (!input) {
            std::cerr << "Error: cannot open " << a.file << "\n";
            return 1;
        }
        std::stringstream text;
        text << input.rdbuf();
        nbt.to_file(nbt.from_snbt(text.str()), a.out, a.compression);
        std::cout << "Wrote: " << a.out << " (" << nbtcodec::get_compression_name(a.compression) << ")\n";
        return 0;
    } catch (const nbtcodec::nbt_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
