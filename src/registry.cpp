#include "nbtcodec/registry.hpp"

#include <utility>

#include "builtins.hpp"

namespace nbtcodec {

TypeRegistry::TypeRegistry() {
    for (ubyte_t type = TAG_BYTE; type <= TAG_BUILTIN_MAX; ++type) {
        TagBehavior behavior;
        behavior.name = get_tag_type(type);
        behavior.make = [type]() { return builtins::zero_value(type); };
        behavior.read = [type](BinaryReader& reader, std::size_t depth) { return builtins::read_payload(type, reader, depth); };
        behavior.write = builtins::write_payload;
        behavior.render = builtins::render;
        switch (type) {
            case TAG_BYTEARRAY: behavior.snbt_prefix = "B"; break;
            case TAG_INTARRAY: behavior.snbt_prefix = "I"; break;
            case TAG_LONGARRAY: behavior.snbt_prefix = "L"; break;
            default: break;
        }
        if (!behavior.snbt_prefix.empty())
            behavior.parse = [type](SnbtParser& parser, std::size_t depth) { return builtins::parse_array(type, parser, depth); };
        else if (type == TAG_LIST)
            behavior.parse = builtins::parse_list;
        else if (type == TAG_COMPOUND)
            behavior.parse = builtins::parse_compound;
        behaviors_[type] = std::move(behavior);
    }
}

void TypeRegistry::register_type(ubyte_t type, TagBehavior behavior) {
    if (type == TAG_END)
        throw nbt_error(errc::duplicate_type_id, "Type id 0 is reserved for the End tag");
    if (behaviors_[type])
        throw nbt_error(errc::duplicate_type_id, "Type id " + std::to_string(type) + " is already registered as " + behaviors_[type]->name);
    if (!behavior.snbt_prefix.empty() && find_prefix(behavior.snbt_prefix))
        throw nbt_error(errc::duplicate_type_id, "SNBT prefix " + behavior.snbt_prefix + " is already registered");
    if (!behavior.make || !behavior.read || !behavior.write || !behavior.render)
        throw std::invalid_argument("Behaviour for type id " + std::to_string(type) + " is missing a make, read, write or render function");
    if (!behavior.snbt_prefix.empty() && !behavior.parse)
        throw std::invalid_argument("Behaviour for type id " + std::to_string(type) + " declares an SNBT prefix without a parse function");
    behaviors_[type] = std::move(behavior);
}

const TagBehavior& TypeRegistry::resolve(ubyte_t type) const {
    if (!behaviors_[type])
        throw nbt_error(errc::unknown_type_id, "No behaviour registered for type id " + std::to_string(type));
    return *behaviors_[type];
}

bool TypeRegistry::contains(ubyte_t type) const { return behaviors_[type].has_value(); }

std::optional<ubyte_t> TypeRegistry::find_prefix(std::string_view prefix) const {
    for (std::size_t type = 0; type < behaviors_.size(); ++type)
        if (behaviors_[type] && !behaviors_[type]->snbt_prefix.empty() && behaviors_[type]->snbt_prefix == prefix)
            return static_cast<ubyte_t>(type);
    return std::nullopt;
}

NBTTag TypeRegistry::instantiate(ubyte_t type) const {
    return NBTTag(static_cast<Tag>(type), resolve(type).make());
}

}
