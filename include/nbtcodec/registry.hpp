#ifndef NBTCODEC_REGISTRY_HPP
#define NBTCODEC_REGISTRY_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "nbtcodec/tag.hpp"

namespace nbtcodec {

class BinaryReader;
class BinaryWriter;
class SnbtRenderer;
class SnbtParser;

/// @brief Everything the codec needs to know about one tag type.
///
/// `read` decodes a payload (no id, no name) and `write` encodes one. `render` appends the
/// SNBT form of a tag. Types with an array-style SNBT form (`[B;...]`) set `snbt_prefix`
/// and `parse`; the parser calls `parse` right after it has consumed `[<prefix>;`.
/// `depth` is the nesting depth of the tag being processed. Containers must pass it to
/// `check_depth` on the reader, writer, renderer or parser before touching their children.
struct TagBehavior {
    std::string name;
    std::function<NBTTag::DataType()> make;
    std::function<NBTTag::DataType(BinaryReader&, std::size_t depth)> read;
    std::function<void(BinaryWriter&, const NBTTag&, std::size_t depth)> write;
    std::function<void(SnbtRenderer&, const NBTTag&, std::size_t depth)> render;
    std::string snbt_prefix;
    std::function<NBTTag(SnbtParser&, std::size_t depth)> parse;
};

/// @brief Maps one-byte type ids to their behaviour.
///
/// A default-constructed registry knows the twelve built-in types. Registries are plain
/// values: a copy is independent of the original. Lookups may run concurrently, registration
/// must not overlap with anything else.
class TypeRegistry {
public:
    TypeRegistry();

    /// @brief Adds a custom type.
    /// @exception Throws `nbt_error(errc::duplicate_type_id)` if `type` is End, is already
    /// registered (built-ins included) or the SNBT prefix is already taken.
    void register_type(ubyte_t type, TagBehavior behavior);
    /// @exception Throws `nbt_error(errc::unknown_type_id)` if nothing is registered for `type`.
    const TagBehavior& resolve(ubyte_t type) const;
    bool contains(ubyte_t type) const;
    /// @return The id whose behaviour claims `prefix` for array-style SNBT, if any.
    std::optional<ubyte_t> find_prefix(std::string_view prefix) const;
    /// @brief Builds a tag of `type` holding its zero value.
    NBTTag instantiate(ubyte_t type) const;

private:
    std::array<std::optional<TagBehavior>, 256> behaviors_;
};

}

#endif
