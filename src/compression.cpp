#include "nbtcodec/compression.hpp"

#include <algorithm>
#include <utility>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zlib.hpp>

namespace nbtcodec {

std::string get_compression_name(CompressionScheme scheme) {
    switch (scheme) {
        case GZIP: return "gzip";
        case ZLIB: return "zlib";
        case NOTHING: return "none";
        default: return "N/A (" + std::to_string(static_cast<int>(scheme)) + ")";
    }
}

void check_compression(CompressionScheme scheme) {
    switch (scheme) {
        case GZIP:
        case ZLIB:
        case NOTHING:
            return;
        default:
            throw nbt_error(errc::unsupported_compression, "Unsupported compression type with ordinal " + std::to_string(static_cast<int>(scheme)));
    }
}

CompressionScheme detect_compression(const char* data, std::size_t size) {
    if (size < 2)
        return NOTHING;
    unsigned char first = static_cast<unsigned char>(data[0]);
    unsigned char second = static_cast<unsigned char>(data[1]);
    if (first == 0x1F && second == 0x8B)
        return GZIP;
    // CMF: deflate method, window <= 32K; CMF/FLG pair is a multiple of 31
    if ((first & 0x0F) == 8 && (first >> 4) <= 7 && ((first << 8) | second) % 31 == 0)
        return ZLIB;
    return NOTHING;
}

namespace internal {

replay_source::replay_source(std::string head, std::istream& rest) : head_(std::move(head)), rest_(&rest) {}

std::streamsize replay_source::read(char* s, std::streamsize n) {
    std::streamsize done = 0;
    if (position_ < head_.size()) {
        std::size_t take = std::min(head_.size() - position_, static_cast<std::size_t>(n));
        std::copy_n(head_.data() + position_, take, s);
        position_ += take;
        done = static_cast<std::streamsize>(take);
    }
    if (done < n && *rest_) {
        rest_->read(s + done, n - done);
        done += rest_->gcount();
        if (rest_->bad())
            throw std::ios_base::failure("underlying stream failed");
    }
    return done == 0 ? -1 : done;
}

}

DecompressingStream::DecompressingStream(std::istream& source) : stream_(&buf_) {
    std::string head(2, '\0');
    std::streampos start(-1);
    try {
        start = source.tellg();
        source.read(head.data(), static_cast<std::streamsize>(head.size()));
    } catch (const std::ios_base::failure& e) {
        throw nbt_error(errc::io_failure, std::string("Stream failure while detecting compression: ") + e.what(), 0);
    }
    if (source.bad())
        throw nbt_error(errc::io_failure, "Stream failure while detecting compression", 0);
    head.resize(static_cast<std::size_t>(source.gcount()));

    scheme_ = detect_compression(head.data(), head.size());
    switch (scheme_) {
        case GZIP:
            buf_.push(boost::iostreams::gzip_decompressor());
            break;
        case ZLIB:
            buf_.push(boost::iostreams::zlib_decompressor());
            break;
        default:
            // seekable and uncompressed: rewind and read the caller's buffer directly, so
            // nothing after the document is consumed
            if (start != std::streampos(-1)) {
                source.clear();
                source.seekg(start);
                if (!source.fail()) {
                    stream_.rdbuf(source.rdbuf());
                    stream_.exceptions(std::ios::badbit);
                    return;
                }
                // a failed seek leaves the position after the head bytes
                source.clear();
            }
            break;
    }
    buf_.push(internal::replay_source(std::move(head), source));
    stream_.exceptions(std::ios::badbit);
}

void write_compressed(std::ostream& out, std::string_view raw, CompressionScheme scheme) {
    check_compression(scheme);
    try {
        if (scheme == NOTHING) {
            out.write(raw.data(), static_cast<std::streamsize>(raw.size()));
        } else {
            boost::iostreams::filtering_istreambuf buf;
            if (scheme == GZIP)
                buf.push(boost::iostreams::gzip_compressor());
            else
                buf.push(boost::iostreams::zlib_compressor());
            buf.push(boost::iostreams::array_source(raw.data(), raw.size()));
            boost::iostreams::copy(buf, out);
        }
    } catch (const std::ios_base::failure& e) {
        throw nbt_error(errc::io_failure, "Failed to write " + get_compression_name(scheme) + " stream: " + e.what());
    }
    if (!out)
        throw nbt_error(errc::io_failure, "Stream rejected " + get_compression_name(scheme) + " output");
}

}
