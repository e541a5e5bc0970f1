#include "nbtcodec/types.hpp"

namespace nbtcodec {

std::string get_tag_type(ubyte_t type) {
    switch (type) {
        case TAG_END: return "End";
        case TAG_BYTE: return "Byte";
        case TAG_SHORT: return "Short";
        case TAG_INT: return "Int";
        case TAG_LONG: return "Long";
        case TAG_FLOAT: return "Float";
        case TAG_DOUBLE: return "Double";
        case TAG_STRING: return "String";
        case TAG_BYTEARRAY: return "ByteArray";
        case TAG_INTARRAY: return "IntArray";
        case TAG_LONGARRAY: return "LongArray";
        case TAG_LIST: return "List";
        case TAG_COMPOUND: return "Compound";
        default: return "N/A (" + std::to_string(type) + ")";
    }
}

const char* errc_name(errc code) {
    switch (code) {
        case errc::unknown_type_id: return "UnknownTypeId";
        case errc::duplicate_type_id: return "DuplicateTypeId";
        case errc::unexpected_end_tag: return "UnexpectedEndTag";
        case errc::malformed_string: return "MalformedString";
        case errc::negative_length: return "NegativeLength";
        case errc::unexpected_eof: return "UnexpectedEof";
        case errc::nesting_too_deep: return "NestingTooDeep";
        case errc::unsupported_compression: return "UnsupportedCompression";
        case errc::unexpected_token: return "UnexpectedToken";
        case errc::unterminated_string: return "UnterminatedString";
        case errc::invalid_number: return "InvalidNumber";
        case errc::type_mismatch: return "TypeMismatch";
        case errc::io_failure: return "IoFailure";
        case errc::malformed_base64: return "MalformedBase64";
    }
    return "Unknown";
}

namespace {

std::string describe(errc code, const std::string& message, std::optional<std::size_t> offset) {
    std::string out = std::string(errc_name(code)) + ": " + message;
    if (offset)
        out += " (at offset " + std::to_string(*offset) + ")";
    return out;
}

}

nbt_error::nbt_error(errc code, const std::string& message, std::optional<std::size_t> offset)
    : std::runtime_error(describe(code, message, offset)), code_(code), offset_(offset) {}

}
