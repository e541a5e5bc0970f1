#ifndef NBTCODEC_TAG_HPP
#define NBTCODEC_TAG_HPP

#include <any>
#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "nbtcodec/types.hpp"

namespace nbtcodec {

class NBTTag;

/// @brief Payload of a tag whose id was registered at runtime.
/// The registry's behaviour bundle for that id is the only code that knows what `value` holds.
struct Extension {
    std::any value;
    bool (*equals)(const std::any&, const std::any&) = nullptr;

    bool operator==(const Extension& other) const;
};

/// @brief An ordered sequence of unnamed tags that all share one type id.
class List {
public:
    using iterator = std::vector<NBTTag>::iterator;
    using const_iterator = std::vector<NBTTag>::const_iterator;

    /// @param element_type The declared element type. `TAG_END` means "not declared yet":
    /// such a list takes the type of the first element added to it while it is empty.
    explicit List(ubyte_t element_type = TAG_END);

    ubyte_t element_type() const;
    /// @brief Appends an element. Throws `nbt_error(errc::type_mismatch)` if its type differs from the element type.
    void add(NBTTag tag);
    /// @brief Replaces the element at `index`, with the same type check as `add`.
    void set(std::size_t index, NBTTag tag);
    void remove(std::size_t index);
    NBTTag& at(std::size_t index);
    const NBTTag& at(std::size_t index) const;
    std::size_t size() const;
    bool empty() const;
    void reserve(std::size_t count);

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const List& other) const;

private:
    void check_element(const NBTTag& tag) const;

    ubyte_t element_type_;
    std::vector<NBTTag> elements_;
};

/// @brief An insertion-ordered mapping of unique names to tags.
class Compound {
public:
    using iterator = std::vector<NBTTag>::iterator;
    using const_iterator = std::vector<NBTTag>::const_iterator;

    /// @brief Inserts `tag` under `name`. An existing entry with the same name is overwritten in place.
    void put(std::string name, NBTTag tag);
    /// @return The entry named `name`, or `nullptr`.
    NBTTag* find(std::string_view name);
    const NBTTag* find(std::string_view name) const;
    NBTTag& at(std::string_view name);
    const NBTTag& at(std::string_view name) const;
    bool contains(std::string_view name) const;
    /// @return Whether an entry was removed.
    bool remove(std::string_view name);
    std::size_t size() const;
    bool empty() const;

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const Compound& other) const;

private:
    std::vector<NBTTag> entries_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

namespace internal {

template <typename T> constexpr int tag_index = -1;
template <> constexpr int tag_index<byte_t> = TAG_BYTE;
template <> constexpr int tag_index<short_t> = TAG_SHORT;
template <> constexpr int tag_index<int_t> = TAG_INT;
template <> constexpr int tag_index<long_t> = TAG_LONG;
template <> constexpr int tag_index<float> = TAG_FLOAT;
template <> constexpr int tag_index<double> = TAG_DOUBLE;
template <> constexpr int tag_index<std::vector<byte_t>> = TAG_BYTEARRAY;
template <> constexpr int tag_index<std::string> = TAG_STRING;
template <> constexpr int tag_index<List> = TAG_LIST;
template <> constexpr int tag_index<Compound> = TAG_COMPOUND;
template <> constexpr int tag_index<std::vector<int_t>> = TAG_INTARRAY;
template <> constexpr int tag_index<std::vector<long_t>> = TAG_LONGARRAY;
template <> constexpr int tag_index<Extension> = TAG_BUILTIN_MAX + 1;

[[noreturn]] void throw_type_mismatch(const NBTTag& tag, int wanted_index);

}

template <typename T> concept NbtType = internal::tag_index<T> >= 0;

class NBTTag {
public:
    /// Alternative `i` holds the payload of built-in type id `i`; the last one holds every extension id.
    using DataType = std::variant<std::monostate,
        byte_t, short_t, int_t, long_t, float, double,
        std::vector<byte_t>, std::string, List, Compound,
        std::vector<int_t>, std::vector<long_t>, Extension>;

    static constexpr std::size_t EXTENSION_INDEX = TAG_BUILTIN_MAX + 1;

    /// @brief Constructs the End sentinel.
    NBTTag() = default;
    /// @brief Constructs a tag. Throws `nbt_error(errc::type_mismatch)` if `value` does not hold the payload kind of `type`.
    NBTTag(Tag type, DataType value, std::optional<std::string> name = {});

    Tag type() const { return type_; }
    /// @brief The key of this tag inside its parent compound (or the root name). Empty for list elements.
    const std::optional<std::string>& name() const { return name_; }
    const DataType& value() const { return value_; }

    /// @brief Gets the payload of this tag.
    /// @tparam T The payload type, e.g. `int_t` for `TAG_INT` or `List` for `TAG_LIST`.
    /// @exception Throws `nbt_error(errc::type_mismatch)` if the tag holds a different payload.
    template <NbtType T> T& get();
    template <NbtType T> const T& get() const;
    template <NbtType T> bool holds() const { return std::holds_alternative<T>(value_); }

    /// @brief Compound member access. Will throw if `this` is not a compound tag or no such member exists.
    NBTTag& at(std::string_view name);
    const NBTTag& at(std::string_view name) const;
    /// @brief List element access. Will throw if `this` is not a list tag or `index` is out of range.
    NBTTag& operator[](std::size_t index);
    const NBTTag& operator[](std::size_t index) const;
    /// @exception Throws if `this` is not a compound tag.
    bool contains(std::string_view key) const;
    /// @brief Number of elements of an array, list or compound tag, or bytes of a string tag.
    std::size_t size() const;

    friend bool operator==(const NBTTag& lhs, const NBTTag& rhs);

private:
    friend class List;
    friend class Compound;

    Tag type_ = TAG_END;
    std::optional<std::string> name_;
    DataType value_;
};

template <NbtType T> T& NBTTag::get() {
    if (T* value = std::get_if<T>(&value_))
        return *value;
    internal::throw_type_mismatch(*this, internal::tag_index<T>);
}

template <NbtType T> const T& NBTTag::get() const {
    if (const T* value = std::get_if<T>(&value_))
        return *value;
    internal::throw_type_mismatch(*this, internal::tag_index<T>);
}

NBTTag make_byte(byte_t value);
NBTTag make_short(short_t value);
NBTTag make_int(int_t value);
NBTTag make_long(long_t value);
NBTTag make_float(float value);
NBTTag make_double(double value);
NBTTag make_string(std::string value);
NBTTag make_byte_array(std::vector<byte_t> value);
NBTTag make_int_array(std::vector<int_t> value);
NBTTag make_long_array(std::vector<long_t> value);
NBTTag make_list(ubyte_t element_type = TAG_END);
NBTTag make_list(List value);
/// @brief Builds a compound tag. Pass a name only for a document root.
NBTTag make_compound(std::optional<std::string> name = {});
NBTTag make_compound(Compound value, std::optional<std::string> name = {});

/// @brief Builds a tag of a registered extension type holding `value`.
/// @param type An id above `TAG_BUILTIN_MAX`.
template <std::equality_comparable T> NBTTag make_extension(ubyte_t type, T value) {
    if (type <= TAG_BUILTIN_MAX)
        throw nbt_error(errc::type_mismatch, "Extension payloads need an id above " + std::to_string(TAG_BUILTIN_MAX) + ", got " + std::to_string(type));
    Extension ext;
    ext.value = std::move(value);
    ext.equals = [](const std::any& lhs, const std::any& rhs) {
        const T* a = std::any_cast<T>(&lhs);
        const T* b = std::any_cast<T>(&rhs);
        return a && b && *a == *b;
    };
    return NBTTag(static_cast<Tag>(type), std::move(ext));
}

/// @brief Typed access to an extension payload.
/// @exception Throws `nbt_error(errc::type_mismatch)` if the tag is not an extension or holds another type.
template <typename T> const T& extension_cast(const NBTTag& tag) {
    if (const T* value = std::any_cast<T>(&tag.get<Extension>().value))
        return *value;
    throw nbt_error(errc::type_mismatch, "Extension tag " + std::to_string(tag.type()) + " holds a different payload type");
}

template <typename T> T& extension_cast(NBTTag& tag) {
    if (T* value = std::any_cast<T>(&tag.get<Extension>().value))
        return *value;
    throw nbt_error(errc::type_mismatch, "Extension tag " + std::to_string(tag.type()) + " holds a different payload type");
}

}

#endif
