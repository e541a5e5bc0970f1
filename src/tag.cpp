#include "nbtcodec/tag.hpp"

#include <bit>
#include <cmath>
#include <utility>

namespace nbtcodec {

namespace internal {

static std::string index_name(int index) {
    if (index > TAG_BUILTIN_MAX)
        return "Extension";
    return get_tag_type(static_cast<ubyte_t>(index));
}

void throw_type_mismatch(const NBTTag& tag, int wanted_index) {
    std::string message = "Tried to extract " + index_name(wanted_index) + " from " + get_tag_type(tag.type()) + " tag";
    if (tag.name())
        message += " " + *tag.name();
    throw nbt_error(errc::type_mismatch, message);
}

// Float.compare semantics: every NaN is equal to every other NaN, and signed zeroes differ.
static bool same_float(float lhs, float rhs) {
    if (std::isnan(lhs) && std::isnan(rhs))
        return true;
    return std::bit_cast<uint_t>(lhs) == std::bit_cast<uint_t>(rhs);
}

static bool same_float(double lhs, double rhs) {
    if (std::isnan(lhs) && std::isnan(rhs))
        return true;
    return std::bit_cast<ulong_t>(lhs) == std::bit_cast<ulong_t>(rhs);
}

}

bool Extension::operator==(const Extension& other) const {
    if (!value.has_value() || !other.value.has_value())
        return value.has_value() == other.value.has_value();
    if (value.type() != other.value.type())
        return false;
    auto compare = equals ? equals : other.equals;
    return compare != nullptr && compare(value, other.value);
}

/* List */

List::List(ubyte_t element_type) : element_type_(element_type) {}

ubyte_t List::element_type() const { return element_type_; }

void List::check_element(const NBTTag& tag) const {
    if (tag.type() == TAG_END)
        throw nbt_error(errc::type_mismatch, "End tags cannot be list elements");
    if (tag.type() != element_type_)
        throw nbt_error(errc::type_mismatch, "Tried to put a " + get_tag_type(tag.type()) + " tag into a list of " + get_tag_type(element_type_));
}

void List::add(NBTTag tag) {
    if (element_type_ == TAG_END && elements_.empty() && tag.type() != TAG_END)
        element_type_ = tag.type();
    check_element(tag);
    tag.name_.reset();
    elements_.push_back(std::move(tag));
}

void List::set(std::size_t index, NBTTag tag) {
    check_element(tag);
    tag.name_.reset();
    at(index) = std::move(tag);
}

void List::remove(std::size_t index) {
    if (index >= elements_.size())
        throw std::out_of_range("List index " + std::to_string(index) + " is out of range (size " + std::to_string(elements_.size()) + ")");
    elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(index));
}

NBTTag& List::at(std::size_t index) {
    if (index >= elements_.size())
        throw std::out_of_range("List index " + std::to_string(index) + " is out of range (size " + std::to_string(elements_.size()) + ")");
    return elements_[index];
}

const NBTTag& List::at(std::size_t index) const {
    if (index >= elements_.size())
        throw std::out_of_range("List index " + std::to_string(index) + " is out of range (size " + std::to_string(elements_.size()) + ")");
    return elements_[index];
}

std::size_t List::size() const { return elements_.size(); }
bool List::empty() const { return elements_.empty(); }
void List::reserve(std::size_t count) { elements_.reserve(count); }

List::iterator List::begin() { return elements_.begin(); }
List::iterator List::end() { return elements_.end(); }
List::const_iterator List::begin() const { return elements_.begin(); }
List::const_iterator List::end() const { return elements_.end(); }

bool List::operator==(const List& other) const {
    return element_type_ == other.element_type_ && elements_ == other.elements_;
}

/* Compound */

void Compound::put(std::string name, NBTTag tag) {
    if (tag.type() == TAG_END)
        throw nbt_error(errc::type_mismatch, "End tags cannot be compound members (key " + name + ")");
    tag.name_ = name;
    auto found = index_.find(name);
    if (found != index_.end()) {
        entries_[found->second] = std::move(tag);
        return;
    }
    index_.emplace(std::move(name), entries_.size());
    entries_.push_back(std::move(tag));
}

NBTTag* Compound::find(std::string_view name) {
    auto found = index_.find(name);
    return found == index_.end() ? nullptr : &entries_[found->second];
}

const NBTTag* Compound::find(std::string_view name) const {
    auto found = index_.find(name);
    return found == index_.end() ? nullptr : &entries_[found->second];
}

NBTTag& Compound::at(std::string_view name) {
    if (NBTTag* tag = find(name))
        return *tag;
    throw std::runtime_error("Tried to get value by name " + std::string(name) + ", but that value does not exist in the compound");
}

const NBTTag& Compound::at(std::string_view name) const {
    if (const NBTTag* tag = find(name))
        return *tag;
    throw std::runtime_error("Tried to get value by name " + std::string(name) + ", but that value does not exist in the compound");
}

bool Compound::contains(std::string_view name) const { return index_.find(name) != index_.end(); }

bool Compound::remove(std::string_view name) {
    auto found = index_.find(name);
    if (found == index_.end())
        return false;
    std::size_t position = found->second;
    index_.erase(found);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
    for (auto& [key, slot] : index_)
        if (slot > position)
            --slot;
    return true;
}

std::size_t Compound::size() const { return entries_.size(); }
bool Compound::empty() const { return entries_.empty(); }

Compound::iterator Compound::begin() { return entries_.begin(); }
Compound::iterator Compound::end() { return entries_.end(); }
Compound::const_iterator Compound::begin() const { return entries_.begin(); }
Compound::const_iterator Compound::end() const { return entries_.end(); }

bool Compound::operator==(const Compound& other) const { return entries_ == other.entries_; }

/* NBTTag */

NBTTag::NBTTag(Tag type, DataType value, std::optional<std::string> name)
    : type_(type), name_(std::move(name)), value_(std::move(value)) {
    std::size_t expected = type_ <= TAG_BUILTIN_MAX ? static_cast<std::size_t>(type_) : EXTENSION_INDEX;
    if (value_.index() != expected)
        throw nbt_error(errc::type_mismatch, "Payload does not match tag type " + get_tag_type(type_));
    if (type_ == TAG_END && name_)
        throw nbt_error(errc::type_mismatch, "End tags carry no name");
}

NBTTag& NBTTag::at(std::string_view name) {
    if (type_ != TAG_COMPOUND)
        throw std::runtime_error("Tried to get value by name " + std::string(name) + " from tag " + name_.value_or("") + ", but that tag is not a compound");
    return std::get<Compound>(value_).at(name);
}

const NBTTag& NBTTag::at(std::string_view name) const {
    if (type_ != TAG_COMPOUND)
        throw std::runtime_error("Tried to get value by name " + std::string(name) + " from tag " + name_.value_or("") + ", but that tag is not a compound");
    return std::get<Compound>(value_).at(name);
}

NBTTag& NBTTag::operator[](std::size_t index) {
    if (type_ != TAG_LIST)
        throw std::runtime_error("Tried to get value by index " + std::to_string(index) + " from tag " + name_.value_or("") + ", but that tag is not a list");
    return std::get<List>(value_).at(index);
}

const NBTTag& NBTTag::operator[](std::size_t index) const {
    if (type_ != TAG_LIST)
        throw std::runtime_error("Tried to get value by index " + std::to_string(index) + " from tag " + name_.value_or("") + ", but that tag is not a list");
    return std::get<List>(value_).at(index);
}

bool NBTTag::contains(std::string_view key) const {
    if (type_ != TAG_COMPOUND)
        throw std::runtime_error("Tried to use contains() on non-compound tag " + name_.value_or(""));
    return std::get<Compound>(value_).contains(key);
}

std::size_t NBTTag::size() const {
    switch (type_) {
        case TAG_BYTEARRAY: return std::get<std::vector<byte_t>>(value_).size();
        case TAG_INTARRAY: return std::get<std::vector<int_t>>(value_).size();
        case TAG_LONGARRAY: return std::get<std::vector<long_t>>(value_).size();
        case TAG_STRING: return std::get<std::string>(value_).size();
        case TAG_LIST: return std::get<List>(value_).size();
        case TAG_COMPOUND: return std::get<Compound>(value_).size();
        default:
            throw std::runtime_error("Tried to use size() on " + get_tag_type(type_) + " tag " + name_.value_or(""));
    }
}

bool operator==(const NBTTag& lhs, const NBTTag& rhs) {
    if (lhs.type_ != rhs.type_ || lhs.name_ != rhs.name_ || lhs.value_.index() != rhs.value_.index())
        return false;
    return std::visit([&rhs](const auto& left) {
        using T = std::decay_t<decltype(left)>;
        const T& right = std::get<T>(rhs.value_);
        if constexpr (std::is_floating_point_v<T>)
            return internal::same_float(left, right);
        else
            return left == right;
    }, lhs.value_);
}

/* builders */

NBTTag make_byte(byte_t value) { return NBTTag(TAG_BYTE, value); }
NBTTag make_short(short_t value) { return NBTTag(TAG_SHORT, value); }
NBTTag make_int(int_t value) { return NBTTag(TAG_INT, value); }
NBTTag make_long(long_t value) { return NBTTag(TAG_LONG, value); }
NBTTag make_float(float value) { return NBTTag(TAG_FLOAT, value); }
NBTTag make_double(double value) { return NBTTag(TAG_DOUBLE, value); }
NBTTag make_string(std::string value) { return NBTTag(TAG_STRING, std::move(value)); }
NBTTag make_byte_array(std::vector<byte_t> value) { return NBTTag(TAG_BYTEARRAY, std::move(value)); }
NBTTag make_int_array(std::vector<int_t> value) { return NBTTag(TAG_INTARRAY, std::move(value)); }
NBTTag make_long_array(std::vector<long_t> value) { return NBTTag(TAG_LONGARRAY, std::move(value)); }
NBTTag make_list(ubyte_t element_type) { return NBTTag(TAG_LIST, List(element_type)); }
NBTTag make_list(List value) { return NBTTag(TAG_LIST, std::move(value)); }
NBTTag make_compound(std::optional<std::string> name) { return NBTTag(TAG_COMPOUND, Compound(), std::move(name)); }
NBTTag make_compound(Compound value, std::optional<std::string> name) { return NBTTag(TAG_COMPOUND, std::move(value), std::move(name)); }

}
