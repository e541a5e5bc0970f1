#ifndef NBTCODEC_BINARY_HPP
#define NBTCODEC_BINARY_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "nbtcodec/registry.hpp"
#include "nbtcodec/tag.hpp"

namespace nbtcodec {

/// @brief Decodes the big-endian binary layout from a stream.
///
/// Every failure is reported as `nbt_error` carrying the byte offset (relative to where the
/// reader started) of the item that could not be read.
class BinaryReader {
public:
    BinaryReader(std::istream& in, const TypeRegistry& registry, std::size_t max_depth = DEFAULT_MAX_DEPTH);

    /// @brief Reads one document: a named root compound.
    NBTTag read_root();
    /// @brief Reads the payload of a tag of type `type` through the registry.
    /// @param name The name to give the resulting tag (unset for list elements).
    NBTTag read_payload(ubyte_t type, std::size_t depth, std::optional<std::string> name = {});

    ubyte_t read_ubyte();
    byte_t read_byte();
    short_t read_short();
    ushort_t read_ushort();
    int_t read_int();
    long_t read_long();
    float read_float();
    double read_double();
    /// @brief Reads a u16 length-prefixed UTF-8 string.
    std::string read_string();
    /// @brief Reads a signed 32-bit length prefix, rejecting negative values.
    std::size_t read_length();
    void read_bytes(char* out, std::size_t count);

    /// @exception Throws `nbt_error(errc::nesting_too_deep)` if `depth` exceeds the maximum.
    void check_depth(std::size_t depth) const;

    std::size_t offset() const { return offset_; }
    std::size_t max_depth() const { return max_depth_; }
    const TypeRegistry& registry() const { return registry_; }

private:
    std::istream& in_;
    const TypeRegistry& registry_;
    std::size_t max_depth_;
    std::size_t offset_ = 0;
};

/// @brief Encodes tags in the layout `BinaryReader` consumes.
class BinaryWriter {
public:
    BinaryWriter(std::ostream& out, const TypeRegistry& registry, std::size_t max_depth = DEFAULT_MAX_DEPTH);

    /// @brief Writes one document. `root` must be a compound; an unnamed root is written with the empty name.
    void write_root(const NBTTag& root);
    /// @brief Writes type id, name and payload.
    void write_named(const NBTTag& tag, std::size_t depth);
    /// @brief Writes the payload only, through the registry.
    void write_payload(const NBTTag& tag, std::size_t depth);

    void write_ubyte(ubyte_t value);
    void write_byte(byte_t value);
    void write_short(short_t value);
    void write_int(int_t value);
    void write_long(long_t value);
    void write_float(float value);
    void write_double(double value);
    void write_string(std::string_view value);
    void write_length(std::size_t length);
    void write_bytes(const char* data, std::size_t count);

    void check_depth(std::size_t depth) const;

    std::size_t offset() const { return offset_; }
    const TypeRegistry& registry() const { return registry_; }

private:
    std::ostream& out_;
    const TypeRegistry& registry_;
    std::size_t max_depth_;
    std::size_t offset_ = 0;
};

/// @brief Reads an uncompressed document from `stream`.
NBTTag read_nbt(std::istream& stream, const TypeRegistry& registry, std::size_t max_depth = DEFAULT_MAX_DEPTH);
/// @brief Writes `root` uncompressed to `stream`.
void write_nbt(std::ostream& stream, const NBTTag& root, const TypeRegistry& registry, std::size_t max_depth = DEFAULT_MAX_DEPTH);

namespace internal {

/// @brief Accepts UTF-8 plus the two Java "modified UTF-8" forms found in real files:
/// `C0 80` for U+0000 and individually encoded surrogate halves.
bool is_valid_utf8(std::string_view bytes);

}

}

#endif
