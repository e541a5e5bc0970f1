#include "nbtcodec/binary.hpp"

#include <algorithm>
#include <bit>
#include <limits>
#include <utility>
#include <vector>

#include "builtins.hpp"

namespace nbtcodec {

namespace {

// Elements allocated ahead of the data when a length prefix is read. A corrupt prefix
// then costs at most this much before the stream runs dry.
constexpr std::size_t READ_CHUNK = 64 * 1024;

template <typename U> U big_endian(U value) {
    if constexpr (std::endian::native == std::endian::little) {
        if constexpr (sizeof(U) == 2)
            return __builtin_bswap16(value);
        else if constexpr (sizeof(U) == 4)
            return __builtin_bswap32(value);
        else if constexpr (sizeof(U) == 8)
            return __builtin_bswap64(value);
    }
    return value;
}

template <typename U> U read_raw(BinaryReader& reader) {
    U value;
    reader.read_bytes(reinterpret_cast<char*>(&value), sizeof(U));
    return big_endian(value);
}

template <typename U> void write_raw(BinaryWriter& writer, U value) {
    value = big_endian(value);
    writer.write_bytes(reinterpret_cast<const char*>(&value), sizeof(U));
}

template <typename T, typename ReadOne> std::vector<T> read_array(BinaryReader& reader, ReadOne read_one) {
    std::size_t length = reader.read_length();
    std::vector<T> out;
    out.reserve(std::min(length, READ_CHUNK));
    for (std::size_t i = 0; i < length; ++i)
        out.push_back(read_one(reader));
    return out;
}

}

namespace internal {

bool is_valid_utf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }
        // modified UTF-8 NUL
        if (lead == 0xC0 && i + 1 < bytes.size() && static_cast<unsigned char>(bytes[i + 1]) == 0x80) {
            i += 2;
            continue;
        }
        std::size_t extra;
        uint_t code_point;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (bytes.size() - i <= extra)
            return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char next = static_cast<unsigned char>(bytes[i + k]);
            if ((next & 0xC0) != 0x80)
                return false;
            code_point = (code_point << 6) | (next & 0x3F);
        }
        if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800)
            || (extra == 3 && (code_point < 0x10000 || code_point > 0x10FFFF)))
            return false;
        i += extra + 1;
    }
    return true;
}

}

/* BinaryReader */

BinaryReader::BinaryReader(std::istream& in, const TypeRegistry& registry, std::size_t max_depth)
    : in_(in), registry_(registry), max_depth_(max_depth) {}

NBTTag BinaryReader::read_root() {
    std::size_t start = offset_;
    ubyte_t type = read_ubyte();
    if (type == TAG_END)
        throw nbt_error(errc::unexpected_end_tag, "Document starts with an End tag instead of a compound", start);
    if (!registry_.contains(type))
        throw nbt_error(errc::unknown_type_id, "Unknown root type id " + std::to_string(type), start);
    if (type != TAG_COMPOUND)
        throw nbt_error(errc::type_mismatch, "Root tag must be a compound, found " + get_tag_type(type), start);
    std::string name = read_string();
    return read_payload(type, 1, std::move(name));
}

NBTTag BinaryReader::read_payload(ubyte_t type, std::size_t depth, std::optional<std::string> name) {
    if (!registry_.contains(type))
        throw nbt_error(errc::unknown_type_id, "Found illegal type " + std::to_string(type), offset_);
    const TagBehavior& behavior = registry_.resolve(type);
    return NBTTag(static_cast<Tag>(type), behavior.read(*this, depth), std::move(name));
}

ubyte_t BinaryReader::read_ubyte() { return read_raw<ubyte_t>(*this); }
byte_t BinaryReader::read_byte() { return static_cast<byte_t>(read_raw<ubyte_t>(*this)); }
short_t BinaryReader::read_short() { return static_cast<short_t>(read_raw<ushort_t>(*this)); }
ushort_t BinaryReader::read_ushort() { return read_raw<ushort_t>(*this); }
int_t BinaryReader::read_int() { return static_cast<int_t>(read_raw<uint_t>(*this)); }
long_t BinaryReader::read_long() { return static_cast<long_t>(read_raw<ulong_t>(*this)); }
float BinaryReader::read_float() { return std::bit_cast<float>(read_raw<uint_t>(*this)); }
double BinaryReader::read_double() { return std::bit_cast<double>(read_raw<ulong_t>(*this)); }

std::string BinaryReader::read_string() {
    std::size_t start = offset_;
    ushort_t length = read_ushort();
    std::string ret(length, '\0');
    try {
        read_bytes(ret.data(), length);
    } catch (const nbt_error& e) {
        if (e.code() != errc::unexpected_eof)
            throw;
        throw nbt_error(errc::malformed_string, "String length " + std::to_string(length) + " runs past the end of the stream", start);
    }
    if (!internal::is_valid_utf8(ret))
        throw nbt_error(errc::malformed_string, "String is not valid UTF-8", start);
    return ret;
}

std::size_t BinaryReader::read_length() {
    std::size_t start = offset_;
    int_t length = read_int();
    if (length < 0)
        throw nbt_error(errc::negative_length, "Negative length " + std::to_string(length), start);
    return static_cast<std::size_t>(length);
}

void BinaryReader::read_bytes(char* out, std::size_t count) {
    if (count == 0)
        return;
    std::size_t start = offset_;
    std::streamsize got = 0;
    try {
        in_.read(out, static_cast<std::streamsize>(count));
        got = in_.gcount();
    } catch (const std::ios_base::failure& e) {
        throw nbt_error(errc::io_failure, std::string("Stream failure: ") + e.what(), start);
    }
    offset_ += static_cast<std::size_t>(got);
    if (in_.bad())
        throw nbt_error(errc::io_failure, "Stream failure while reading", start);
    if (static_cast<std::size_t>(got) != count)
        throw nbt_error(errc::unexpected_eof, "Needed " + std::to_string(count) + " bytes but the stream ended after " + std::to_string(got), start);
}

void BinaryReader::check_depth(std::size_t depth) const {
    if (depth > max_depth_)
        throw nbt_error(errc::nesting_too_deep, "Nesting depth " + std::to_string(depth) + " exceeds the maximum of " + std::to_string(max_depth_), offset_);
}

/* BinaryWriter */

BinaryWriter::BinaryWriter(std::ostream& out, const TypeRegistry& registry, std::size_t max_depth)
    : out_(out), registry_(registry), max_depth_(max_depth) {}

void BinaryWriter::write_root(const NBTTag& root) {
    if (root.type() != TAG_COMPOUND)
        throw nbt_error(errc::type_mismatch, "Root tag must be a compound, found " + get_tag_type(root.type()));
    write_named(root, 1);
}

void BinaryWriter::write_named(const NBTTag& tag, std::size_t depth) {
    if (!registry_.contains(tag.type()))
        throw nbt_error(errc::unknown_type_id, "Cannot write tag with unregistered type id " + std::to_string(tag.type()), offset_);
    write_ubyte(tag.type());
    write_string(tag.name().value_or(""));
    write_payload(tag, depth);
}

void BinaryWriter::write_payload(const NBTTag& tag, std::size_t depth) {
    if (!registry_.contains(tag.type()))
        throw nbt_error(errc::unknown_type_id, "Cannot write tag with unregistered type id " + std::to_string(tag.type()), offset_);
    registry_.resolve(tag.type()).write(*this, tag, depth);
}

void BinaryWriter::write_ubyte(ubyte_t value) { write_raw(*this, value); }
void BinaryWriter::write_byte(byte_t value) { write_raw(*this, static_cast<ubyte_t>(value)); }
void BinaryWriter::write_short(short_t value) { write_raw(*this, static_cast<ushort_t>(value)); }
void BinaryWriter::write_int(int_t value) { write_raw(*this, static_cast<uint_t>(value)); }
void BinaryWriter::write_long(long_t value) { write_raw(*this, static_cast<ulong_t>(value)); }
void BinaryWriter::write_float(float value) { write_raw(*this, std::bit_cast<uint_t>(value)); }
void BinaryWriter::write_double(double value) { write_raw(*this, std::bit_cast<ulong_t>(value)); }

void BinaryWriter::write_string(std::string_view value) {
    if (value.size() > std::numeric_limits<ushort_t>::max())
        throw nbt_error(errc::malformed_string, "String of " + std::to_string(value.size()) + " bytes does not fit a u16 length", offset_);
    if (!internal::is_valid_utf8(value))
        throw nbt_error(errc::malformed_string, "String is not valid UTF-8", offset_);
    write_raw(*this, static_cast<ushort_t>(value.size()));
    write_bytes(value.data(), value.size());
}

void BinaryWriter::write_length(std::size_t length) {
    if (length > static_cast<std::size_t>(std::numeric_limits<int_t>::max()))
        throw std::length_error("Length " + std::to_string(length) + " does not fit a signed 32-bit prefix");
    write_int(static_cast<int_t>(length));
}

void BinaryWriter::write_bytes(const char* data, std::size_t count) {
    if (count == 0)
        return;
    try {
        out_.write(data, static_cast<std::streamsize>(count));
    } catch (const std::ios_base::failure& e) {
        throw nbt_error(errc::io_failure, std::string("Stream failure: ") + e.what(), offset_);
    }
    if (!out_)
        throw nbt_error(errc::io_failure, "Stream rejected write", offset_);
    offset_ += count;
}

void BinaryWriter::check_depth(std::size_t depth) const {
    if (depth > max_depth_)
        throw nbt_error(errc::nesting_too_deep, "Nesting depth " + std::to_string(depth) + " exceeds the maximum of " + std::to_string(max_depth_), offset_);
}

NBTTag read_nbt(std::istream& stream, const TypeRegistry& registry, std::size_t max_depth) {
    BinaryReader reader(stream, registry, max_depth);
    return reader.read_root();
}

void write_nbt(std::ostream& stream, const NBTTag& root, const TypeRegistry& registry, std::size_t max_depth) {
    BinaryWriter writer(stream, registry, max_depth);
    writer.write_root(root);
}

/* built-in payloads */

namespace builtins {

NBTTag::DataType zero_value(ubyte_t type) {
    switch (type) {
        case TAG_BYTE: return byte_t(0);
        case TAG_SHORT: return short_t(0);
        case TAG_INT: return int_t(0);
        case TAG_LONG: return long_t(0);
        case TAG_FLOAT: return 0.0f;
        case TAG_DOUBLE: return 0.0;
        case TAG_BYTEARRAY: return std::vector<byte_t>();
        case TAG_STRING: return std::string();
        case TAG_LIST: return List();
        case TAG_COMPOUND: return Compound();
        case TAG_INTARRAY: return std::vector<int_t>();
        case TAG_LONGARRAY: return std::vector<long_t>();
        default: throw nbt_error(errc::unknown_type_id, "No built-in type with id " + std::to_string(type));
    }
}

NBTTag::DataType read_payload(ubyte_t type, BinaryReader& reader, std::size_t depth) {
    switch (type) {
        case TAG_BYTE: return reader.read_byte();
        case TAG_SHORT: return reader.read_short();
        case TAG_INT: return reader.read_int();
        case TAG_LONG: return reader.read_long();
        case TAG_FLOAT: return reader.read_float();
        case TAG_DOUBLE: return reader.read_double();
        case TAG_STRING: return reader.read_string();
        case TAG_BYTEARRAY: {
            std::size_t length = reader.read_length();
            std::vector<byte_t> out;
            while (out.size() < length) {
                std::size_t filled = out.size();
                out.resize(filled + std::min(length - filled, READ_CHUNK));
                reader.read_bytes(reinterpret_cast<char*>(out.data() + filled), out.size() - filled);
            }
            return out;
        }
        case TAG_INTARRAY:
            return read_array<int_t>(reader, [](BinaryReader& r) { return r.read_int(); });
        case TAG_LONGARRAY:
            return read_array<long_t>(reader, [](BinaryReader& r) { return r.read_long(); });
        case TAG_LIST: {
            reader.check_depth(depth);
            std::size_t start = reader.offset();
            ubyte_t element_type = reader.read_ubyte();
            std::size_t count = reader.read_length();
            if (element_type == TAG_END && count > 0)
                throw nbt_error(errc::unexpected_end_tag, "List of " + std::to_string(count) + " elements declares element type End", start);
            if (element_type != TAG_END && !reader.registry().contains(element_type))
                throw nbt_error(errc::unknown_type_id, "List declares unknown element type " + std::to_string(element_type), start);
            List list(element_type);
            list.reserve(std::min(count, READ_CHUNK));
            for (std::size_t i = 0; i < count; ++i)
                list.add(reader.read_payload(element_type, depth + 1));
            return list;
        }
        case TAG_COMPOUND: {
            reader.check_depth(depth);
            Compound compound;
            for (ubyte_t next = reader.read_ubyte(); next != TAG_END; next = reader.read_ubyte()) {
                std::string name = reader.read_string();
                compound.put(name, reader.read_payload(next, depth + 1, name));
            }
            return compound;
        }
        default:
            throw nbt_error(errc::unknown_type_id, "Found illegal type " + std::to_string(type), reader.offset());
    }
}

void write_payload(BinaryWriter& writer, const NBTTag& tag, std::size_t depth) {
    switch (tag.type()) {
        case TAG_BYTE: writer.write_byte(tag.get<byte_t>()); break;
        case TAG_SHORT: writer.write_short(tag.get<short_t>()); break;
        case TAG_INT: writer.write_int(tag.get<int_t>()); break;
        case TAG_LONG: writer.write_long(tag.get<long_t>()); break;
        case TAG_FLOAT: writer.write_float(tag.get<float>()); break;
        case TAG_DOUBLE: writer.write_double(tag.get<double>()); break;
        case TAG_STRING: writer.write_string(tag.get<std::string>()); break;
        case TAG_BYTEARRAY: {
            const auto& values = tag.get<std::vector<byte_t>>();
            writer.write_length(values.size());
            writer.write_bytes(reinterpret_cast<const char*>(values.data()), values.size());
            break;
        }
        case TAG_INTARRAY: {
            const auto& values = tag.get<std::vector<int_t>>();
            writer.write_length(values.size());
            for (int_t value : values)
                writer.write_int(value);
            break;
        }
        case TAG_LONGARRAY: {
            const auto& values = tag.get<std::vector<long_t>>();
            writer.write_length(values.size());
            for (long_t value : values)
                writer.write_long(value);
            break;
        }
        case TAG_LIST: {
            writer.check_depth(depth);
            const List& list = tag.get<List>();
            ubyte_t element_type = list.element_type();
            if (element_type == TAG_END && !list.empty())
                throw nbt_error(errc::type_mismatch, "Non-empty list declares element type End", writer.offset());
            if (element_type != TAG_END && !writer.registry().contains(element_type))
                throw nbt_error(errc::unknown_type_id, "List declares unregistered element type " + std::to_string(element_type), writer.offset());
            writer.write_ubyte(element_type);
            writer.write_length(list.size());
            for (const NBTTag& element : list) {
                if (element.type() != element_type)
                    throw nbt_error(errc::type_mismatch, "List of " + get_tag_type(element_type) + " contains a " + get_tag_type(element.type()) + " tag", writer.offset());
                writer.write_payload(element, depth + 1);
            }
            break;
        }
        case TAG_COMPOUND: {
            writer.check_depth(depth);
            for (const NBTTag& entry : tag.get<Compound>())
                writer.write_named(entry, depth + 1);
            writer.write_ubyte(TAG_END);
            break;
        }
        default:
            throw nbt_error(errc::unknown_type_id, "No built-in type with id " + std::to_string(tag.type()), writer.offset());
    }
}

}

}
