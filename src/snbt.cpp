#include "nbtcodec/snbt.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <type_traits>
#include <utility>

#include "builtins.hpp"

namespace nbtcodec {

namespace {

enum class NumberShape { none, integer, floating };

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.' || c == '+';
}

std::size_t count_digits(std::string_view text, std::size_t& i) {
    std::size_t start = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])))
        ++i;
    return i - start;
}

NumberShape shape_of(std::string_view text) {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-'))
        ++i;
    std::size_t digits = count_digits(text, i);
    bool fractional = false;
    if (i < text.size() && text[i] == '.') {
        fractional = true;
        ++i;
        digits += count_digits(text, i);
    }
    if (digits == 0)
        return NumberShape::none;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        fractional = true;
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-'))
            ++i;
        if (count_digits(text, i) == 0)
            return NumberShape::none;
    }
    if (i != text.size())
        return NumberShape::none;
    return fractional ? NumberShape::floating : NumberShape::integer;
}

// Words that start like a number must be one.
bool looks_numeric(std::string_view text) {
    auto digit_at = [&text](std::size_t i) { return i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); };
    if (text.empty())
        return false;
    if (digit_at(0))
        return true;
    if (text[0] == '.')
        return digit_at(1);
    if (text[0] == '+' || text[0] == '-')
        return digit_at(1) || (text.size() > 2 && text[1] == '.' && digit_at(2));
    return false;
}

std::string_view strip_plus(std::string_view text) {
    if (!text.empty() && text[0] == '+')
        text.remove_prefix(1);
    return text;
}

template <typename F> std::optional<F> special_floating(std::string_view text) {
    if (text == "NaN")
        return std::numeric_limits<F>::quiet_NaN();
    if (text == "Infinity" || text == "+Infinity")
        return std::numeric_limits<F>::infinity();
    if (text == "-Infinity")
        return -std::numeric_limits<F>::infinity();
    return std::nullopt;
}

// libstdc++ reports subnormal results as out of range; strtof/strtod take them and
// only an overflow to infinity is rejected.
template <typename F> bool parse_floating(std::string_view digits, F& value) {
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ptr != digits.data() + digits.size())
        return false;
    if (result.ec == std::errc())
        return true;
    if (result.ec != std::errc::result_out_of_range)
        return false;
    std::string text(digits);
    if constexpr (std::is_same_v<F, float>)
        value = std::strtof(text.c_str(), nullptr);
    else
        value = std::strtod(text.c_str(), nullptr);
    return std::isfinite(value);
}

template <typename F> std::string format_floating(F value) {
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value < 0 ? "-Infinity" : "Infinity";
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, result.ptr);
}

std::string format_double(double value) {
    std::string text = format_floating(value);
    if (text.find_first_of(".eE") == std::string::npos)
        text += 'd';
    return text;
}

}

namespace internal {

bool is_plain_identifier(std::string_view key) {
    if (key.empty())
        return false;
    for (char c : key)
        if (!is_word_char(c))
            return false;
    return true;
}

}

/* SnbtRenderer */

SnbtRenderer::SnbtRenderer(const TypeRegistry& registry, SnbtConfig config, std::size_t max_depth)
    : registry_(registry), config_(std::move(config)), max_depth_(max_depth) {}

std::string SnbtRenderer::render(const NBTTag& tag) {
    out_.clear();
    render_value(tag, 1);
    return std::move(out_);
}

void SnbtRenderer::render_value(const NBTTag& tag, std::size_t depth) {
    registry_.resolve(tag.type()).render(*this, tag, depth);
}

void SnbtRenderer::render_sequence(std::string_view open, std::string_view close, std::size_t count, bool nested,
                                   std::size_t depth, const std::function<void(std::size_t)>& element) {
    append(open);
    if (count == 0) {
        append(close);
        return;
    }
    bool multiline = config_.pretty_print && (nested || count > config_.inline_threshold);
    if (config_.pretty_print && !multiline && open.back() == ';')
        append(" ");
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0)
            append(config_.pretty_print && !multiline ? ", " : ",");
        if (multiline)
            newline(depth);
        element(i);
    }
    if (multiline)
        newline(depth - 1);
    append(close);
}

void SnbtRenderer::append(std::string_view text) { out_.append(text); }

void SnbtRenderer::append_key(std::string_view key) {
    if (!config_.force_quote_keys && internal::is_plain_identifier(key))
        append(key);
    else
        append_quoted(key);
}

void SnbtRenderer::append_quoted(std::string_view text) {
    out_ += '"';
    for (char c : text) {
        if (c == '"' || c == '\\')
            out_ += '\\';
        out_ += c;
    }
    out_ += '"';
}

void SnbtRenderer::newline(std::size_t level) {
    if (!config_.pretty_print)
        return;
    out_ += '\n';
    for (std::size_t i = 0; i < level; ++i)
        out_ += config_.indent;
}

void SnbtRenderer::check_depth(std::size_t depth) const {
    if (depth > max_depth_)
        throw nbt_error(errc::nesting_too_deep, "Nesting depth " + std::to_string(depth) + " exceeds the maximum of " + std::to_string(max_depth_));
}

/* SnbtParser */

SnbtParser::SnbtParser(std::string_view text, const TypeRegistry& registry, std::size_t max_depth)
    : text_(text), registry_(registry), max_depth_(max_depth) {}

NBTTag SnbtParser::parse_root() {
    skip_whitespace();
    std::size_t start = position_;
    NBTTag root = parse_value(1);
    if (root.type() != TAG_COMPOUND)
        fail(errc::type_mismatch, "Root tag must be a compound, found " + get_tag_type(root.type()), start);
    skip_whitespace();
    if (!at_end())
        fail(errc::unexpected_token, std::string("Unexpected '") + peek() + "' after the root compound", position_);
    return make_compound(std::move(root.get<Compound>()), "");
}

NBTTag SnbtParser::parse_value(std::size_t depth) {
    skip_whitespace();
    if (at_end())
        fail(errc::unexpected_token, "Expected a value but reached the end of input", position_);
    std::size_t start = position_;
    char c = peek();
    if (c == '{') {
        ++position_;
        return registry_.resolve(TAG_COMPOUND).parse(*this, depth);
    }
    if (c == '[') {
        std::size_t i = position_ + 1;
        while (i < text_.size() && std::isalpha(static_cast<unsigned char>(text_[i])))
            ++i;
        if (i > position_ + 1 && i < text_.size() && text_[i] == ';') {
            std::string_view prefix = text_.substr(position_ + 1, i - position_ - 1);
            std::optional<ubyte_t> type = registry_.find_prefix(prefix);
            if (!type)
                fail(errc::unexpected_token, "Unknown array prefix " + std::string(prefix), start);
            position_ = i + 1;
            return registry_.resolve(*type).parse(*this, depth);
        }
        ++position_;
        return registry_.resolve(TAG_LIST).parse(*this, depth);
    }
    if (c == '"' || c == '\'')
        return make_string(parse_quoted());
    std::string_view word = parse_word();
    if (word.empty())
        fail(errc::unexpected_token, std::string("Unexpected '") + c + "'", start);
    return parse_literal(word, start);
}

std::string SnbtParser::parse_key() {
    skip_whitespace();
    if (peek() == '"' || peek() == '\'')
        return parse_quoted();
    std::size_t start = position_;
    std::string_view word = parse_word();
    if (word.empty())
        fail(errc::unexpected_token, at_end() ? "Expected a key but reached the end of input" : std::string("Expected a key, found '") + peek() + "'", start);
    return std::string(word);
}

std::string SnbtParser::parse_quoted() {
    std::size_t start = position_;
    char quote = text_[position_++];
    std::string out;
    while (true) {
        if (at_end())
            fail(errc::unterminated_string, "String is never closed", start);
        char c = text_[position_++];
        if (c == quote)
            return out;
        if (c != '\\') {
            out += c;
            continue;
        }
        if (at_end())
            fail(errc::unterminated_string, "String is never closed", start);
        char escaped = text_[position_++];
        switch (escaped) {
            case '\\':
            case '"':
            case '\'':
                out += escaped;
                break;
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            default:
                fail(errc::unexpected_token, std::string("Invalid escape \\") + escaped, position_ - 2);
        }
    }
}

std::string_view SnbtParser::parse_word() {
    std::size_t start = position_;
    while (!at_end() && is_word_char(text_[position_]))
        ++position_;
    return text_.substr(start, position_ - start);
}

void SnbtParser::skip_whitespace() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(text_[position_])))
        ++position_;
}

bool SnbtParser::accept(char c) {
    skip_whitespace();
    if (peek() != c || at_end())
        return false;
    ++position_;
    return true;
}

void SnbtParser::expect(char c) {
    if (accept(c))
        return;
    if (at_end())
        fail(errc::unexpected_token, std::string("Expected '") + c + "' but reached the end of input", position_);
    fail(errc::unexpected_token, std::string("Expected '") + c + "', found '" + peek() + "'", position_);
}

void SnbtParser::check_depth(std::size_t depth) const {
    if (depth > max_depth_)
        fail(errc::nesting_too_deep, "Nesting depth " + std::to_string(depth) + " exceeds the maximum of " + std::to_string(max_depth_), position_);
}

void SnbtParser::fail(errc code, const std::string& message, std::size_t position) const {
    std::size_t line = 1;
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < position && i < text_.size(); ++i) {
        if (text_[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    throw nbt_error(code, message + " at line " + std::to_string(line) + ", column " + std::to_string(position - line_start + 1), position);
}

NBTTag SnbtParser::parse_literal(std::string_view word, std::size_t start) const {
    if (word == "true")
        return make_byte(1);
    if (word == "false")
        return make_byte(0);

    char suffix = 0;
    std::string_view body = word;
    if (word.size() > 1) {
        char last = static_cast<char>(std::tolower(static_cast<unsigned char>(word.back())));
        if (std::strchr("bslfd", last)) {
            suffix = last;
            body.remove_suffix(1);
        }
    }
    if (suffix == 'f')
        if (auto special = special_floating<float>(body))
            return make_float(*special);
    if (suffix == 'd')
        if (auto special = special_floating<double>(body))
            return make_double(*special);
    if (!looks_numeric(body))
        return make_string(std::string(word));

    NumberShape shape = shape_of(body);
    if (shape == NumberShape::none)
        fail(errc::invalid_number, "Invalid number " + std::string(word), start);
    std::string_view digits = strip_plus(body);

    if (suffix == 'f' || suffix == 'd' || (suffix == 0 && shape == NumberShape::floating)) {
        if (suffix == 'f') {
            float value;
            if (!parse_floating(digits, value))
                fail(errc::invalid_number, "Float out of range: " + std::string(word), start);
            return make_float(value);
        }
        double value;
        if (!parse_floating(digits, value))
            fail(errc::invalid_number, "Double out of range: " + std::string(word), start);
        return make_double(value);
    }

    if (shape != NumberShape::integer)
        fail(errc::invalid_number, "Expected an integer: " + std::string(word), start);
    long_t value;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc() || result.ptr != digits.data() + digits.size())
        fail(errc::invalid_number, "Integer out of range: " + std::string(word), start);
    switch (suffix) {
        case 'b':
            if (value < std::numeric_limits<byte_t>::min() || value > std::numeric_limits<byte_t>::max())
                fail(errc::invalid_number, "Byte out of range: " + std::string(word), start);
            return make_byte(static_cast<byte_t>(value));
        case 's':
            if (value < std::numeric_limits<short_t>::min() || value > std::numeric_limits<short_t>::max())
                fail(errc::invalid_number, "Short out of range: " + std::string(word), start);
            return make_short(static_cast<short_t>(value));
        case 'l':
            return make_long(value);
        default:
            if (value < std::numeric_limits<int_t>::min() || value > std::numeric_limits<int_t>::max())
                fail(errc::invalid_number, "Int out of range (add an l suffix for a long): " + std::string(word), start);
            return make_int(static_cast<int_t>(value));
    }
}

std::string to_snbt(const NBTTag& tag, const TypeRegistry& registry, const SnbtConfig& config, std::size_t max_depth) {
    SnbtRenderer renderer(registry, config, max_depth);
    return renderer.render(tag);
}

NBTTag from_snbt(std::string_view text, const TypeRegistry& registry, std::size_t max_depth) {
    SnbtParser parser(text, registry, max_depth);
    return parser.parse_root();
}

/* built-in SNBT forms */

namespace builtins {

namespace {

template <typename T> void render_array(SnbtRenderer& renderer, std::string_view open, const std::vector<T>& values,
                                        std::string_view suffix, std::size_t depth) {
    renderer.render_sequence(open, "]", values.size(), false, depth, [&](std::size_t i) {
        renderer.append(std::to_string(static_cast<long_t>(values[i])));
        renderer.append(suffix);
    });
}

}

void render(SnbtRenderer& renderer, const NBTTag& tag, std::size_t depth) {
    switch (tag.type()) {
        case TAG_BYTE: renderer.append(std::to_string(tag.get<byte_t>()) + "b"); break;
        case TAG_SHORT: renderer.append(std::to_string(tag.get<short_t>()) + "s"); break;
        case TAG_INT: renderer.append(std::to_string(tag.get<int_t>())); break;
        case TAG_LONG: renderer.append(std::to_string(tag.get<long_t>()) + "l"); break;
        case TAG_FLOAT: renderer.append(format_floating(tag.get<float>()) + "f"); break;
        case TAG_DOUBLE: renderer.append(format_double(tag.get<double>())); break;
        case TAG_STRING: renderer.append_quoted(tag.get<std::string>()); break;
        case TAG_BYTEARRAY: render_array(renderer, "[B;", tag.get<std::vector<byte_t>>(), "b", depth); break;
        case TAG_INTARRAY: render_array(renderer, "[I;", tag.get<std::vector<int_t>>(), "", depth); break;
        case TAG_LONGARRAY: render_array(renderer, "[L;", tag.get<std::vector<long_t>>(), "l", depth); break;
        case TAG_LIST: {
            renderer.check_depth(depth);
            const List& list = tag.get<List>();
            bool nested = list.element_type() == TAG_LIST || list.element_type() == TAG_COMPOUND;
            renderer.render_sequence("[", "]", list.size(), nested, depth, [&](std::size_t i) {
                renderer.render_value(list.at(i), depth + 1);
            });
            break;
        }
        case TAG_COMPOUND: {
            renderer.check_depth(depth);
            const Compound& compound = tag.get<Compound>();
            renderer.append("{");
            bool first = true;
            for (const NBTTag& entry : compound) {
                if (!first)
                    renderer.append(",");
                first = false;
                renderer.newline(depth);
                renderer.append_key(entry.name().value_or(""));
                renderer.append(renderer.config().pretty_print ? ": " : ":");
                renderer.render_value(entry, depth + 1);
            }
            if (!compound.empty())
                renderer.newline(depth - 1);
            renderer.append("}");
            break;
        }
        default:
            throw nbt_error(errc::unknown_type_id, "No built-in type with id " + std::to_string(tag.type()));
    }
}

NBTTag parse_array(ubyte_t type, SnbtParser& parser, std::size_t depth) {
    ubyte_t element_type = type == TAG_BYTEARRAY ? TAG_BYTE : type == TAG_INTARRAY ? TAG_INT : TAG_LONG;
    std::vector<long_t> values;
    if (!parser.accept(']')) {
        do {
            parser.skip_whitespace();
            std::size_t start = parser.position();
            // elements are number literals, never nested values
            char next = parser.peek();
            if (parser.at_end() || next == '[' || next == '{' || next == '"' || next == '\'')
                parser.fail(errc::unexpected_token, get_tag_type(type) + " elements must be numbers", start);
            NBTTag element = parser.parse_value(depth + 1);
            if (element.type() != element_type)
                parser.fail(errc::type_mismatch, get_tag_type(type) + " cannot hold a " + get_tag_type(element.type()), start);
            switch (element_type) {
                case TAG_BYTE: values.push_back(element.get<byte_t>()); break;
                case TAG_INT: values.push_back(element.get<int_t>()); break;
                default: values.push_back(element.get<long_t>()); break;
            }
        } while (parser.accept(','));
        parser.expect(']');
    }
    switch (type) {
        case TAG_BYTEARRAY: return make_byte_array(std::vector<byte_t>(values.begin(), values.end()));
        case TAG_INTARRAY: return make_int_array(std::vector<int_t>(values.begin(), values.end()));
        default: return make_long_array(std::move(values));
    }
}

NBTTag parse_list(SnbtParser& parser, std::size_t depth) {
    parser.check_depth(depth);
    List list;
    if (parser.accept(']'))
        return make_list(std::move(list));
    do {
        parser.skip_whitespace();
        std::size_t start = parser.position();
        NBTTag element = parser.parse_value(depth + 1);
        if (!list.empty() && element.type() != list.element_type())
            parser.fail(errc::type_mismatch, "List of " + get_tag_type(list.element_type()) + " cannot hold a " + get_tag_type(element.type()), start);
        list.add(std::move(element));
    } while (parser.accept(','));
    parser.expect(']');
    return make_list(std::move(list));
}

NBTTag parse_compound(SnbtParser& parser, std::size_t depth) {
    parser.check_depth(depth);
    Compound compound;
    if (parser.accept('}'))
        return make_compound(std::move(compound));
    do {
        std::string key = parser.parse_key();
        parser.expect(':');
        NBTTag value = parser.parse_value(depth + 1);
        compound.put(std::move(key), std::move(value));
    } while (parser.accept(','));
    parser.expect('}');
    return make_compound(std::move(compound));
}

}

}
