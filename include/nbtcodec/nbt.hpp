#ifndef NBTCODEC_NBT_HPP
#define NBTCODEC_NBT_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "nbtcodec/binary.hpp"
#include "nbtcodec/compression.hpp"
#include "nbtcodec/registry.hpp"
#include "nbtcodec/snbt.hpp"
#include "nbtcodec/tag.hpp"
#include "nbtcodec/types.hpp"

namespace nbtcodec {

/// @brief Standard entry point for reading and writing NBT documents.
///
/// An instance owns its configuration: one type registry, one SNBT config and a nesting limit.
/// Changing any of them affects later calls only. Instances are safe to use from several
/// threads at once as long as nobody calls a setter meanwhile.
class Nbt {
public:
    /// @brief Uses a registry holding the twelve built-in types.
    Nbt();
    explicit Nbt(TypeRegistry registry, SnbtConfig snbt_config = {}, std::size_t max_depth = DEFAULT_MAX_DEPTH);

    /// @brief Writes `root` to `output`, optionally compressed.
    void to_stream(const NBTTag& root, std::ostream& output, CompressionScheme compression = NOTHING) const;
    /// @brief Reads a root compound from `input`. Compression is detected from the first bytes.
    /// @note An uncompressed, seekable `input` is left right after the document, so several
    /// documents can be read in a row. Compressed or non-seekable input is read ahead in chunks.
    NBTTag from_stream(std::istream& input) const;

    void to_file(const NBTTag& root, const std::filesystem::path& path, CompressionScheme compression = NOTHING) const;
    NBTTag from_file(const std::filesystem::path& path) const;

    std::vector<ubyte_t> to_bytes(const NBTTag& root, CompressionScheme compression = NOTHING) const;
    NBTTag from_bytes(const std::vector<ubyte_t>& bytes) const;

    /// @brief Encodes the uncompressed binary form as base64 text.
    std::string to_base64(const NBTTag& root) const;
    /// @exception Throws `nbt_error(errc::malformed_base64)` if `encoded` is not valid base64.
    NBTTag from_base64(std::string_view encoded) const;

    std::string to_snbt(const NBTTag& root) const;
    NBTTag from_snbt(std::string_view text) const;

    const TypeRegistry& type_registry() const { return registry_; }
    void set_type_registry(TypeRegistry registry) { registry_ = std::move(registry); }
    const SnbtConfig& snbt_config() const { return snbt_config_; }
    void set_snbt_config(SnbtConfig config) { snbt_config_ = std::move(config); }
    std::size_t max_depth() const { return max_depth_; }
    void set_max_depth(std::size_t max_depth) { max_depth_ = max_depth; }

private:
    NBTTag read_document(std::istream& input, const std::string& source) const;

    TypeRegistry registry_;
    SnbtConfig snbt_config_;
    std::size_t max_depth_;
};

namespace internal {

std::string encode_base64(const std::vector<ubyte_t>& bytes);
std::vector<ubyte_t> decode_base64(std::string_view encoded);

}

}

#endif
