#ifndef NBTCODEC_TYPES_HPP
#define NBTCODEC_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace nbtcodec {

typedef int8_t byte_t;
typedef uint8_t ubyte_t;
typedef int16_t short_t;
typedef uint16_t ushort_t;
typedef int32_t int_t;
typedef uint32_t uint_t;
typedef int64_t long_t;
typedef uint64_t ulong_t;

/// @brief Maximum container nesting accepted by every traversal unless configured otherwise.
constexpr std::size_t DEFAULT_MAX_DEPTH = 512;

enum Tag : ubyte_t {
    TAG_END = '\x00',
    TAG_BYTE = '\x01',
    TAG_SHORT = '\x02',
    TAG_INT = '\x03',
    TAG_LONG = '\x04',
    TAG_FLOAT = '\x05',
    TAG_DOUBLE = '\x06',
    TAG_BYTEARRAY = '\x07',
    TAG_STRING = '\x08',
    TAG_LIST = '\t',
    TAG_COMPOUND = '\n',
    TAG_INTARRAY = '\v',
    TAG_LONGARRAY = '\f',
};

/// @brief Highest id owned by the format itself. Anything above is an extension id.
constexpr ubyte_t TAG_BUILTIN_MAX = TAG_LONGARRAY;

std::string get_tag_type(ubyte_t type);

enum class errc {
    unknown_type_id,
    duplicate_type_id,
    unexpected_end_tag,
    malformed_string,
    negative_length,
    unexpected_eof,
    nesting_too_deep,
    unsupported_compression,
    unexpected_token,
    unterminated_string,
    invalid_number,
    type_mismatch,
    io_failure,
    malformed_base64,
};

const char* errc_name(errc code);

/// @brief The single exception type raised by the codec.
/// @note `offset()` is a byte offset for binary input and a character offset for SNBT.
class nbt_error : public std::runtime_error {
public:
    nbt_error(errc code, const std::string& message, std::optional<std::size_t> offset = {});

    errc code() const noexcept { return code_; }
    std::optional<std::size_t> offset() const noexcept { return offset_; }

private:
    errc code_;
    std::optional<std::size_t> offset_;
};

}

#endif
