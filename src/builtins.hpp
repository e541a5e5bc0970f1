#ifndef NBTCODEC_SRC_BUILTINS_HPP
#define NBTCODEC_SRC_BUILTINS_HPP

#include "nbtcodec/binary.hpp"
#include "nbtcodec/snbt.hpp"

// Payload logic for the twelve built-in types, bound into every default TypeRegistry.
namespace nbtcodec::builtins {

NBTTag::DataType zero_value(ubyte_t type);

NBTTag::DataType read_payload(ubyte_t type, BinaryReader& reader, std::size_t depth);
void write_payload(BinaryWriter& writer, const NBTTag& tag, std::size_t depth);

void render(SnbtRenderer& renderer, const NBTTag& tag, std::size_t depth);
NBTTag parse_array(ubyte_t type, SnbtParser& parser, std::size_t depth);
NBTTag parse_list(SnbtParser& parser, std::size_t depth);
NBTTag parse_compound(SnbtParser& parser, std::size_t depth);

}

#endif
