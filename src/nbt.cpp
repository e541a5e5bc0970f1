#include "nbtcodec/nbt.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

namespace nbtcodec {

namespace internal {

std::string encode_base64(const std::vector<ubyte_t>& bytes) {
    using namespace boost::archive::iterators;
    using encoder = base64_from_binary<transform_width<std::vector<ubyte_t>::const_iterator, 6, 8>>;
    std::string out(encoder(bytes.begin()), encoder(bytes.end()));
    out.append((3 - bytes.size() % 3) % 3, '=');
    return out;
}

std::vector<ubyte_t> decode_base64(std::string_view encoded) {
    using namespace boost::archive::iterators;
    using decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;
    if (encoded.size() % 4 != 0)
        throw nbt_error(errc::malformed_base64, "Base64 text of " + std::to_string(encoded.size()) + " characters is not padded to a multiple of 4");
    std::size_t padding = 0;
    while (padding < 2 && padding < encoded.size() && encoded[encoded.size() - 1 - padding] == '=')
        ++padding;
    // padding decodes as zero bits and is cut off afterwards
    std::string text(encoded);
    std::replace(text.end() - static_cast<std::ptrdiff_t>(padding), text.end(), '=', 'A');
    std::vector<ubyte_t> out;
    try {
        out.assign(decoder(text.cbegin()), decoder(text.cend()));
    } catch (const dataflow_exception& e) {
        throw nbt_error(errc::malformed_base64, e.what());
    }
    out.resize(out.size() - padding);
    return out;
}

}

Nbt::Nbt() : Nbt(TypeRegistry()) {}

Nbt::Nbt(TypeRegistry registry, SnbtConfig snbt_config, std::size_t max_depth)
    : registry_(std::move(registry)), snbt_config_(std::move(snbt_config)), max_depth_(max_depth) {}

void Nbt::to_stream(const NBTTag& root, std::ostream& output, CompressionScheme compression) const {
    check_compression(compression);
    if (compression == NOTHING) {
        write_nbt(output, root, registry_, max_depth_);
        return;
    }
    std::ostringstream raw(std::ios::binary);
    write_nbt(raw, root, registry_, max_depth_);
    write_compressed(output, raw.view(), compression);
}

NBTTag Nbt::from_stream(std::istream& input) const {
    DecompressingStream decoded(input);
    return read_nbt(decoded.stream(), registry_, max_depth_);
}

void Nbt::to_file(const NBTTag& root, const std::filesystem::path& path, CompressionScheme compression) const {
    // encode first so a failing tree never truncates an existing file
    std::vector<ubyte_t> bytes = to_bytes(root, compression);
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output)
        throw nbt_error(errc::io_failure, "Cannot open " + path.string() + " for writing");
    output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    output.close();
    if (!output)
        throw nbt_error(errc::io_failure, "Failed to write " + path.string());
}

NBTTag Nbt::from_file(const std::filesystem::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input)
        throw nbt_error(errc::io_failure, "Cannot open " + path.string() + " for reading");
    return read_document(input, path.string());
}

std::vector<ubyte_t> Nbt::to_bytes(const NBTTag& root, CompressionScheme compression) const {
    std::ostringstream output(std::ios::binary);
    to_stream(root, output, compression);
    std::string_view bytes = output.view();
    return std::vector<ubyte_t>(bytes.begin(), bytes.end());
}

NBTTag Nbt::from_bytes(const std::vector<ubyte_t>& bytes) const {
    boost::iostreams::stream<boost::iostreams::array_source> input(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return read_document(input, "byte array");
}

std::string Nbt::to_base64(const NBTTag& root) const {
    return internal::encode_base64(to_bytes(root));
}

NBTTag Nbt::from_base64(std::string_view encoded) const {
    return from_bytes(internal::decode_base64(encoded));
}

std::string Nbt::to_snbt(const NBTTag& root) const {
    return nbtcodec::to_snbt(root, registry_, snbt_config_, max_depth_);
}

NBTTag Nbt::from_snbt(std::string_view text) const {
    return nbtcodec::from_snbt(text, registry_, max_depth_);
}

NBTTag Nbt::read_document(std::istream& input, const std::string& source) const {
    DecompressingStream decoded(input);
    NBTTag root = read_nbt(decoded.stream(), registry_, max_depth_);
    try {
        if (decoded.stream().peek() != std::char_traits<char>::eof())
            std::cerr << "[nbtcodec] WARNING: ignoring data after the root compound in " << source << "\n";
    } catch (const std::ios_base::failure& e) {
        std::cerr << "[nbtcodec] WARNING: unreadable data after the root compound in " << source << " (" << e.what() << ")\n";
    }
    return root;
}

}
