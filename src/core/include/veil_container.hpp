#pragma once

/**
 * @file veil_container.hpp
 * @brief Stego container framing
 *
 * Wire format (written into the carrier's bit slots, never a standalone file):
 *   [magic "VEILSTG1":8][metadata_len:u32 LE][metadata][payload_len:u32 LE][payload]
 *
 * Metadata block is UTF-8 text:
 *   veil-meta/1\n
 *   key=value\n ...
 * Values escape '\\', '\n', '\r' and '=' with a backslash. Entry order is
 * preserved and unknown keys survive a parse/serialize cycle.
 */

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace veil {

static constexpr size_t CONTAINER_MAGIC_LEN = 8;
static constexpr uint8_t CONTAINER_MAGIC[CONTAINER_MAGIC_LEN] = {
    'V', 'E', 'I', 'L', 'S', 'T', 'G', '1'
};
static constexpr size_t CONTAINER_LENGTH_PREFIX = 4;
static constexpr size_t CONTAINER_FIXED_OVERHEAD =
    CONTAINER_MAGIC_LEN + 2 * CONTAINER_LENGTH_PREFIX;

static constexpr const char* METADATA_HEADER = "veil-meta/1";

class Metadata {
public:
    using Entry = std::pair<std::string, std::string>;

    // Replaces the value in place if the key exists, appends otherwise
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    size_t size() const { return entries_.size(); }
    const std::vector<Entry>& entries() const { return entries_; }

    std::vector<uint8_t> serialize() const;

    // Throws StegoError(MalformedMetadata)
    static Metadata deserialize(const uint8_t* data, size_t len);
    static Metadata deserialize(const std::vector<uint8_t>& block) {
        return deserialize(block.data(), block.size());
    }

private:
    std::vector<Entry> entries_;
};

struct ParsedContainer {
    size_t offset = 0;                 // where the magic was found
    std::vector<uint8_t> metadata;     // raw metadata block, as written
    std::vector<uint8_t> payload;      // ciphertext block or plaintext
};

class ContainerCodec {
public:
    static std::vector<uint8_t> frame(
        const std::vector<uint8_t>& metadata_block,
        const std::vector<uint8_t>& payload);

    static size_t framed_size(size_t metadata_len, size_t payload_len) noexcept {
        return CONTAINER_FIXED_OVERHEAD + metadata_len + payload_len;
    }

    /**
     * Scan for the magic and read both length-prefixed blocks.
     * Throws StegoError(NoContainerFound) if no magic is present and
     * StegoError(TruncatedContainer) if a declared length overruns the input.
     */
    static ParsedContainer parse(const uint8_t* data, size_t len);
    static ParsedContainer parse(const std::vector<uint8_t>& bytes) {
        return parse(bytes.data(), bytes.size());
    }

    /**
     * For a container expected at offset 0: how many bytes are needed to
     * learn (or hold) the whole container given the prefix seen so far.
     * Returns a value <= len once the prefix holds the full container.
     * Throws StegoError(NoContainerFound) when the prefix is long enough to
     * show the magic is missing.
     */
    static size_t required_length(const uint8_t* data, size_t len);
};

} // namespace veil
