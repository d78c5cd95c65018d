#include "veil_stego.hpp"
#include "veil_capacity.hpp"
#include "veil_logger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace veil {

namespace {

constexpr size_t CHECKSUM_HEX_LEN = 64;

Crypto::KdfParams resolve_kdf(const CodecOptions& codec) {
    Crypto::KdfParams p = Crypto::KdfParams::interactive();
    if (codec.kdf_opslimit != 0) p.opslimit = codec.kdf_opslimit;
    if (codec.kdf_memlimit != 0) p.memlimit = codec.kdf_memlimit;
    if (!p.within_limits()) {
        throw std::invalid_argument("configured Argon2id cost is outside libsodium limits");
    }
    return p;
}

Metadata build_metadata(const std::string& checksum,
                        size_t payload_size,
                        const std::string& original_filename,
                        bool encrypted,
                        uint32_t factor,
                        const Crypto::KdfParams& kdf)
{
    const bool is_text = original_filename.empty();
    Metadata meta;
    meta.set("version", CONTAINER_VERSION);
    meta.set("encrypted", encrypted ? "true" : "false");
    meta.set("content_type", content_type_to_string(is_text ? ContentType::Text : ContentType::File));
    meta.set("original_filename", is_text ? TEXT_FILENAME_SENTINEL : original_filename);
    meta.set("checksum", checksum);
    meta.set("redundancy", std::to_string(factor));
    meta.set("payload_size", std::to_string(payload_size));
    if (encrypted) {
        meta.set("cipher", CIPHER_NAME);
        meta.set("kdf", KDF_NAME);
        meta.set("kdf_ops", std::to_string(kdf.opslimit));
        meta.set("kdf_mem", std::to_string(kdf.memlimit));
    }
    return meta;
}

std::optional<uint64_t> parse_u64(const std::string& s) {
    if (s.empty() || s.size() > 19) return std::nullopt;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoull(s);
}

bool is_hex_digest(const std::string& s) {
    return s.size() == CHECKSUM_HEX_LEN &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) {
               return std::isdigit(c) != 0 || (c >= 'a' && c <= 'f');
           });
}

} // namespace

const char* content_type_to_string(ContentType type) noexcept {
    return type == ContentType::Text ? "text" : "file";
}

// ==================== Hide ====================

std::vector<uint8_t> hide(const std::vector<uint8_t>& carrier,
                          CarrierType type,
                          const std::vector<uint8_t>& payload,
                          const std::string& original_filename,
                          const HideOptions& options)
{
    VEIL_LOG_INFO(std::string("[Stego] hide into ") + carrier_type_to_string(type) +
                  " carrier: " + std::to_string(payload.size()) + " payload bytes");

    CarrierCodec codec = load_carrier(type, carrier, options.codec);
    const size_t slots = slot_count(codec);

    const bool encrypted = options.password.has_value();
    const Crypto::KdfParams kdf = resolve_kdf(options.codec);
    const std::string checksum = Crypto::sha256_hex(payload.data(), payload.size());
    const size_t block_size = encrypted ? Crypto::sealed_size(payload.size()) : payload.size();

    auto container_bytes = [&](uint32_t f) {
        Metadata meta = build_metadata(checksum, payload.size(), original_filename, encrypted, f, kdf);
        return ContainerCodec::framed_size(meta.serialize().size(), block_size);
    };

    const uint32_t factor = CapacityPlanner::choose_factor(
        container_bytes, slots, type, options.redundancy, options.codec);
    CapacityPlanner::validate(container_bytes(factor), slots, factor);

    VEIL_LOG_DEBUG("[Stego] " + std::to_string(slots) + " slots, redundancy " +
                   std::to_string(factor) + ", container " +
                   std::to_string(container_bytes(factor)) + " bytes");

    const std::vector<uint8_t> meta_block =
        build_metadata(checksum, payload.size(), original_filename, encrypted, factor, kdf).serialize();

    std::vector<uint8_t> block;
    if (encrypted) {
        Crypto crypto(options.codec.memory_lock);
        SecureString password(*options.password);
        block = crypto.seal(payload.data(), payload.size(), password, meta_block, kdf);
    } else {
        block = payload;
    }

    const std::vector<uint8_t> container = ContainerCodec::frame(meta_block, block);
    const RedundancyPlan plan = RedundancyCoder::plan_for(slots, factor, header_layout_for(type));
    const std::vector<SlotRun> runs = RedundancyCoder::place(bytes_to_bits(container), plan);

    std::vector<uint8_t> out = write_slots(codec, runs);
    VEIL_LOG_INFO("[Stego] hide complete: " + std::to_string(out.size()) + " output bytes");
    return out;
}

std::vector<uint8_t> hide(const std::vector<uint8_t>& carrier,
                          CarrierType type,
                          const std::vector<uint8_t>& payload,
                          const std::string& original_filename,
                          const std::string& password,
                          HideOptions options)
{
    options.password = password;
    return hide(carrier, type, payload, original_filename, options);
}

// ==================== Extract / capacity ====================

ExtractResult extract(const std::vector<uint8_t>& carrier,
                      CarrierType type,
                      const std::string& password,
                      const CodecOptions& codec)
{
    VEIL_LOG_INFO(std::string("[Stego] extract from ") + carrier_type_to_string(type) +
                  " carrier, " + std::to_string(carrier.size()) + " bytes");

    CarrierCodec loaded = load_carrier(type, carrier, codec);
    ExtractionOrchestrator orchestrator(loaded, codec);
    SecureString secret(password);
    ExtractResult result = orchestrator.run(secret);

    VEIL_LOG_INFO("[Stego] extract complete: " + std::to_string(result.payload.size()) +
                  " payload bytes");
    return result;
}

uint64_t capacity(const std::vector<uint8_t>& carrier, CarrierType type, const CodecOptions& codec) {
    CarrierCodec loaded = load_carrier(type, carrier, codec);
    return CapacityPlanner::capacity_bits(slot_count(loaded), 1);
}

size_t framed_size(size_t payload_size,
                   const std::string& original_filename,
                   bool encrypted,
                   uint32_t factor,
                   const CodecOptions& codec)
{
    const std::string placeholder(CHECKSUM_HEX_LEN, '0');
    Metadata meta = build_metadata(placeholder, payload_size, original_filename, encrypted,
                                   factor, resolve_kdf(codec));
    return ContainerCodec::framed_size(
        meta.serialize().size(),
        encrypted ? Crypto::sealed_size(payload_size) : payload_size);
}

// ==================== ExtractionOrchestrator ====================

const char* ExtractionOrchestrator::state_to_string(State state) noexcept {
    switch (state) {
        case State::Start:           return "Start";
        case State::LocateContainer: return "LocateContainer";
        case State::ParseMetadata:   return "ParseMetadata";
        case State::Decrypt:         return "Decrypt";
        case State::VerifyChecksum:  return "VerifyChecksum";
        case State::Done:            return "Done";
        case State::Failed:          return "Failed";
    }
    return "Unknown";
}

ExtractionOrchestrator::ExtractionOrchestrator(const CarrierCodec& carrier, const CodecOptions& options)
    : carrier_(carrier)
    , options_(options)
{}

void ExtractionOrchestrator::transition(State next) {
    VEIL_LOG_DEBUG(std::string("[Extract] ") + state_to_string(state_) + " -> " + state_to_string(next));
    state_ = next;
}

void ExtractionOrchestrator::fail(ErrorKind kind, const std::string& detail) {
    VEIL_LOG_DEBUG(std::string("[Extract] ") + state_to_string(state_) + " -> Failed(" +
                   error_kind_to_string(kind) + "): " + detail);
    state_ = State::Failed;
    failure_ = kind;
    plaintext_.zero();
    if (kind == ErrorKind::WrongPasswordOrCorruption) {
        // Which check failed stays on the operator log above
        throw StegoError(kind, "authentication or integrity check failed");
    }
    throw StegoError(kind, detail);
}

ExtractResult ExtractionOrchestrator::run(const SecureString& password) {
    if (state_ != State::Start) {
        throw std::logic_error("ExtractionOrchestrator::run called twice");
    }

    transition(State::LocateContainer);
    try {
        locate_container();
    } catch (const StegoError& e) {
        fail(ErrorKind::NoHiddenData, e.what());
    }

    transition(State::ParseMetadata);
    try {
        parse_metadata();
    } catch (const StegoError& e) {
        fail(ErrorKind::MalformedMetadata, e.what());
    }

    transition(State::Decrypt);
    try {
        decrypt(password);
    } catch (const StegoError& e) {
        fail(ErrorKind::WrongPasswordOrCorruption, e.what());
    }

    transition(State::VerifyChecksum);
    verify_checksum();

    transition(State::Done);
    ExtractResult result;
    result.payload = plaintext_.to_vector();
    result.content_type = content_type_;
    result.original_filename = content_type_ == ContentType::Text ? "" : filename_;
    plaintext_.zero();
    return result;
}

std::vector<uint8_t> ExtractionOrchestrator::read_logical(
    const RedundancyPlan& plan, size_t byte_offset, size_t count) const
{
    const size_t first_bit = byte_offset * 8;
    const size_t bit_count = count * 8;
    if (first_bit + bit_count > plan.stride) {
        throw StegoError(ErrorKind::TruncatedContainer, "container runs past the stripe end");
    }

    std::vector<BitStream> copies(plan.factor);
    for (uint32_t r = 0; r < plan.factor; ++r) {
        BitStream& copy = copies[r];
        copy.reserve(bit_count);
        const size_t data_first = static_cast<size_t>(r) * plan.stride + first_bit;
        for (const SlotSpan& span : plan.spans(data_first, bit_count)) {
            BitStream part = read_slots(carrier_, span.first_slot, span.count);
            copy.insert(copy.end(), part.begin(), part.end());
        }
    }
    return bits_to_bytes(RedundancyCoder::vote(copies));
}

void ExtractionOrchestrator::locate_container() {
    const size_t slots = slot_count(carrier_);
    if (slots < PLAN_HEADER_SLOTS + CONTAINER_FIXED_OVERHEAD * 8) {
        throw StegoError(ErrorKind::NoHiddenData, "carrier too small to hold a container");
    }

    const HeaderLayout layout = header_layout_for(carrier_type_of(carrier_));
    factor_ = RedundancyCoder::decode_header(read_plan_header(carrier_, layout));
    if (factor_ == 0 || factor_ > MAX_REDUNDANCY) {
        throw StegoError(ErrorKind::NoHiddenData, "plan header does not hold a valid redundancy factor");
    }
    const RedundancyPlan plan = RedundancyCoder::plan_for(slots, factor_, layout);
    VEIL_LOG_DEBUG(std::string("[Extract] plan header (") + header_layout_to_string(layout) +
                   "): redundancy " + std::to_string(factor_) + ", stride " + std::to_string(plan.stride));

    // Only collapse as many logical bytes as the length prefixes call for
    std::vector<uint8_t> stream;
    size_t need = ContainerCodec::required_length(stream.data(), stream.size());
    while (need > stream.size()) {
        std::vector<uint8_t> more = read_logical(plan, stream.size(), need - stream.size());
        stream.insert(stream.end(), more.begin(), more.end());
        need = ContainerCodec::required_length(stream.data(), stream.size());
    }
    container_ = ContainerCodec::parse(stream.data(), stream.size());
}

void ExtractionOrchestrator::parse_metadata() {
    const Metadata meta = Metadata::deserialize(container_.metadata);

    auto require = [&meta](const char* key) {
        auto v = meta.get(key);
        if (!v) {
            throw StegoError(ErrorKind::MalformedMetadata, std::string("missing key '") + key + "'");
        }
        return *v;
    };

    const auto version = meta.get("version");
    if (version && *version != CONTAINER_VERSION) {
        throw StegoError(ErrorKind::MalformedMetadata, "unsupported container version " + *version);
    }

    const std::string encrypted = require("encrypted");
    if (encrypted != "true" && encrypted != "false") {
        throw StegoError(ErrorKind::MalformedMetadata, "encrypted must be true or false");
    }
    encrypted_ = encrypted == "true";

    const std::string content_type = require("content_type");
    if (content_type == "text") {
        content_type_ = ContentType::Text;
    } else if (content_type == "file") {
        content_type_ = ContentType::File;
    } else {
        throw StegoError(ErrorKind::MalformedMetadata, "unknown content_type '" + content_type + "'");
    }

    filename_ = require("original_filename");

    checksum_ = require("checksum");
    if (!is_hex_digest(checksum_)) {
        throw StegoError(ErrorKind::MalformedMetadata, "checksum is not a SHA-256 hex digest");
    }

    const auto redundancy = parse_u64(require("redundancy"));
    if (!redundancy || *redundancy != factor_) {
        throw StegoError(ErrorKind::MalformedMetadata, "redundancy disagrees with the plan header");
    }

    if (const auto size = meta.get("payload_size")) {
        payload_size_ = parse_u64(*size);
        if (!payload_size_) {
            throw StegoError(ErrorKind::MalformedMetadata, "payload_size is not an integer");
        }
    }

    if (encrypted_) {
        if (require("cipher") != CIPHER_NAME) {
            throw StegoError(ErrorKind::MalformedMetadata, "unsupported cipher");
        }
        if (require("kdf") != KDF_NAME) {
            throw StegoError(ErrorKind::MalformedMetadata, "unsupported kdf");
        }
        const auto ops = parse_u64(require("kdf_ops"));
        const auto mem = parse_u64(require("kdf_mem"));
        if (!ops || !mem) {
            throw StegoError(ErrorKind::MalformedMetadata, "kdf cost is not an integer");
        }
        kdf_.opslimit = *ops;
        kdf_.memlimit = static_cast<size_t>(*mem);
        if (!kdf_.within_limits()) {
            throw StegoError(ErrorKind::MalformedMetadata, "kdf cost outside accepted limits");
        }
    }
}

void ExtractionOrchestrator::decrypt(const SecureString& password) {
    if (!encrypted_) {
        plaintext_ = SecureMemory(container_.payload.data(), container_.payload.size());
        return;
    }
    Crypto crypto(options_.memory_lock);
    plaintext_ = crypto.open(container_.payload, password, container_.metadata, kdf_);
}

void ExtractionOrchestrator::verify_checksum() {
    const std::string actual = Crypto::sha256_hex(plaintext_.data(), plaintext_.size());
    if (!SecureOps::constant_time_compare(actual.data(), checksum_.data(), CHECKSUM_HEX_LEN)) {
        fail(ErrorKind::WrongPasswordOrCorruption, "checksum mismatch");
    }
    if (payload_size_ && *payload_size_ != plaintext_.size()) {
        fail(ErrorKind::WrongPasswordOrCorruption, "payload_size mismatch");
    }
}

} // namespace veil
