#ifndef NBTCODEC_COMPRESSION_HPP
#define NBTCODEC_COMPRESSION_HPP

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

#include "nbtcodec/types.hpp"

namespace nbtcodec {

/// @brief Compression envelope around a binary document.
/// Values follow the chunk compression ids of Minecraft region files.
enum CompressionScheme {
    GZIP = 1,
    ZLIB = 2,
    NOTHING = 3,
};

std::string get_compression_name(CompressionScheme scheme);

/// @exception Throws `nbt_error(errc::unsupported_compression)` for a value outside the enum.
void check_compression(CompressionScheme scheme);

/// @brief Identifies the envelope from the first bytes of a stream: gzip magic `1F 8B`,
/// then a valid zlib header, else no compression.
CompressionScheme detect_compression(const char* data, std::size_t size);

namespace internal {

/// @brief Boost.Iostreams source that yields bytes already taken from a stream, then the rest of it.
/// Lets detection peek at a non-seekable stream without losing what it read.
class replay_source {
public:
    typedef char char_type;
    typedef boost::iostreams::source_tag category;

    replay_source(std::string head, std::istream& rest);
    std::streamsize read(char* s, std::streamsize n);

private:
    std::string head_;
    std::size_t position_ = 0;
    std::istream* rest_;
};

}

/// @brief Wraps a stream, detects its compression and exposes the decoded bytes.
/// @note Decoder failures surface from `stream()` reads as `std::ios_base::failure`.
/// An uncompressed seekable source is rewound and read directly, so it is consumed
/// only as far as the caller reads.
class DecompressingStream {
public:
    explicit DecompressingStream(std::istream& source);
    DecompressingStream(const DecompressingStream&) = delete;
    DecompressingStream& operator=(const DecompressingStream&) = delete;

    std::istream& stream() { return stream_; }
    CompressionScheme scheme() const { return scheme_; }

private:
    CompressionScheme scheme_ = NOTHING;
    boost::iostreams::filtering_istreambuf buf_;
    std::istream stream_;
};

/// @brief Writes `raw` to `out` inside the requested envelope.
void write_compressed(std::ostream& out, std::string_view raw, CompressionScheme scheme);

}

#endif
