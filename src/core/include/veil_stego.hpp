#pragma once

/**
 * @file veil_stego.hpp
 * @brief Collaborator-facing hide / extract / capacity
 *
 * Hide:    payload -> seal (metadata as AAD) -> frame -> capacity check ->
 *          replicate -> carrier slots -> encoded carrier
 * Extract: carrier slots -> plan header -> majority vote -> parse ->
 *          open -> checksum -> payload
 *
 * All calls are synchronous and keep no state between calls.
 */

#include "veil_carrier.hpp"
#include "veil_container.hpp"
#include "veil_crypto.hpp"
#include "veil_errors.hpp"
#include "veil_options.hpp"
#include "veil_redundancy.hpp"
#include "veil_secure_memory.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veil {

static constexpr const char* CONTAINER_VERSION = "1";
static constexpr const char* CIPHER_NAME = "chacha20poly1305-ietf";
static constexpr const char* KDF_NAME = "argon2id13";
static constexpr const char* TEXT_FILENAME_SENTINEL = "-";

enum class ContentType {
    Text,
    File
};

const char* content_type_to_string(ContentType type) noexcept;

struct HideOptions {
    Redundancy redundancy;
    std::optional<std::string> password;   // absent = unencrypted container
    CodecOptions codec;
};

struct ExtractResult {
    std::vector<uint8_t> payload;
    std::string original_filename;         // "" for text payloads
    ContentType content_type = ContentType::Text;
};

/**
 * Embed payload into carrier. An empty original_filename marks the payload
 * as a text message. Throws StegoError; nothing is written on failure.
 */
std::vector<uint8_t> hide(const std::vector<uint8_t>& carrier,
                          CarrierType type,
                          const std::vector<uint8_t>& payload,
                          const std::string& original_filename,
                          const HideOptions& options);

// Always encrypts, even with an empty password
std::vector<uint8_t> hide(const std::vector<uint8_t>& carrier,
                          CarrierType type,
                          const std::vector<uint8_t>& payload,
                          const std::string& original_filename,
                          const std::string& password,
                          HideOptions options = {});

ExtractResult extract(const std::vector<uint8_t>& carrier,
                      CarrierType type,
                      const std::string& password,
                      const CodecOptions& codec = {});

/// Logical bits available at redundancy 1.
uint64_t capacity(const std::vector<uint8_t>& carrier,
                  CarrierType type,
                  const CodecOptions& codec = {});

/// Bytes the framed container occupies for a payload of the given size.
size_t framed_size(size_t payload_size,
                   const std::string& original_filename,
                   bool encrypted,
                   uint32_t factor,
                   const CodecOptions& codec = {});

/**
 * @brief Extraction state machine
 *
 *   Start -> LocateContainer -> ParseMetadata -> Decrypt -> VerifyChecksum -> Done
 *
 * Any state may move to Failed; the failure kind is fixed per state so the
 * caller sees NoHiddenData, MalformedMetadata or WrongPasswordOrCorruption.
 */
class ExtractionOrchestrator {
public:
    enum class State {
        Start,
        LocateContainer,
        ParseMetadata,
        Decrypt,
        VerifyChecksum,
        Done,
        Failed
    };

    ExtractionOrchestrator(const CarrierCodec& carrier, const CodecOptions& options);

    // One-shot: a second call throws std::logic_error
    ExtractResult run(const SecureString& password);

    State state() const noexcept { return state_; }
    std::optional<ErrorKind> failure() const noexcept { return failure_; }

    static const char* state_to_string(State state) noexcept;

private:
    void transition(State next);
    [[noreturn]] void fail(ErrorKind kind, const std::string& detail);

    void locate_container();
    void parse_metadata();
    void decrypt(const SecureString& password);
    void verify_checksum();

    std::vector<uint8_t> read_logical(const RedundancyPlan& plan, size_t byte_offset, size_t count) const;

    const CarrierCodec& carrier_;
    CodecOptions options_;
    State state_ = State::Start;
    std::optional<ErrorKind> failure_;

    uint32_t factor_ = 0;
    ParsedContainer container_;
    bool encrypted_ = false;
    ContentType content_type_ = ContentType::Text;
    std::string filename_;
    std::string checksum_;
    std::optional<uint64_t> payload_size_;
    Crypto::KdfParams kdf_;
    SecureMemory plaintext_;
};

} // namespace veil
