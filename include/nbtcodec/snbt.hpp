#ifndef NBTCODEC_SNBT_HPP
#define NBTCODEC_SNBT_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "nbtcodec/registry.hpp"
#include "nbtcodec/tag.hpp"

namespace nbtcodec {

struct SnbtConfig {
    /// Put compound members, and lists or arrays longer than `inline_threshold`, on their own lines.
    bool pretty_print = false;
    /// Quote every compound key, even plain identifiers.
    bool force_quote_keys = false;
    /// In pretty mode, sequences of scalars up to this length stay on one line.
    std::size_t inline_threshold = 8;
    std::string indent = "    ";
};

/// @brief Produces the textual (SNBT) form of a tag tree.
class SnbtRenderer {
public:
    SnbtRenderer(const TypeRegistry& registry, SnbtConfig config = {}, std::size_t max_depth = DEFAULT_MAX_DEPTH);

    /// @brief Renders `tag` (at depth 1) and returns the text.
    std::string render(const NBTTag& tag);
    /// @brief Appends the SNBT form of `tag` through the registry.
    void render_value(const NBTTag& tag, std::size_t depth);

    /// @brief Appends `count` elements between `open` and `close`, separated by commas.
    /// In pretty mode the elements go on separate lines, one level deeper than `depth - 1`,
    /// unless there are few of them and `nested` is false.
    void render_sequence(std::string_view open, std::string_view close, std::size_t count, bool nested,
                         std::size_t depth, const std::function<void(std::size_t)>& element);

    void append(std::string_view text);
    /// @brief Appends a compound key, quoted only when it is not a plain identifier.
    void append_key(std::string_view key);
    /// @brief Appends `text` in double quotes, escaping `"` and `\`.
    void append_quoted(std::string_view text);
    /// @brief Line break plus indentation; does nothing unless pretty printing.
    void newline(std::size_t level);

    void check_depth(std::size_t depth) const;

    const SnbtConfig& config() const { return config_; }
    const TypeRegistry& registry() const { return registry_; }

private:
    const TypeRegistry& registry_;
    SnbtConfig config_;
    std::size_t max_depth_;
    std::string out_;
};

/// @brief Recursive-descent parser for SNBT.
///
/// Errors are `nbt_error`s whose offset is the character position of the fault; the message
/// also names line and column.
class SnbtParser {
public:
    SnbtParser(std::string_view text, const TypeRegistry& registry, std::size_t max_depth = DEFAULT_MAX_DEPTH);

    /// @brief Parses a whole document: one compound and nothing after it. The result is named `""`.
    NBTTag parse_root();
    /// @brief Parses any value starting at the current position.
    NBTTag parse_value(std::size_t depth);
    /// @brief Parses a compound key, quoted or plain.
    std::string parse_key();
    /// @brief Parses a string in single or double quotes.
    std::string parse_quoted();
    /// @brief Reads a run of plain identifier characters, possibly empty.
    std::string_view parse_word();

    void skip_whitespace();
    bool at_end() const { return position_ >= text_.size(); }
    /// @brief The next character, or `'\0'` at the end of input.
    char peek() const { return at_end() ? '\0' : text_[position_]; }
    /// @brief Skips whitespace, then consumes `c` if it is next.
    bool accept(char c);
    /// @brief Like `accept`, but throws `errc::unexpected_token` when `c` is not next.
    void expect(char c);
    std::size_t position() const { return position_; }

    void check_depth(std::size_t depth) const;
    [[noreturn]] void fail(errc code, const std::string& message, std::size_t position) const;

    const TypeRegistry& registry() const { return registry_; }

private:
    NBTTag parse_literal(std::string_view word, std::size_t start) const;

    std::string_view text_;
    const TypeRegistry& registry_;
    std::size_t max_depth_;
    std::size_t position_ = 0;
};

std::string to_snbt(const NBTTag& tag, const TypeRegistry& registry, const SnbtConfig& config = {}, std::size_t max_depth = DEFAULT_MAX_DEPTH);
NBTTag from_snbt(std::string_view text, const TypeRegistry& registry, std::size_t max_depth = DEFAULT_MAX_DEPTH);

namespace internal {

/// @brief Whether `key` can be written without quotes: non-empty, only `[A-Za-z0-9_\-.+]`.
bool is_plain_identifier(std::string_view key);

}

}

#endif
