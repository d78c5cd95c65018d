#include "veil_container.hpp"
#include "veil_errors.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace veil {

namespace {

void put_u32_le(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

uint32_t get_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

bool magic_at(const uint8_t* p) {
    return std::memcmp(p, CONTAINER_MAGIC, CONTAINER_MAGIC_LEN) == 0;
}

void escape_into(std::string& out, const std::string& value) {
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '=':  out += "\\=";  break;
            default:   out += c;      break;
        }
    }
}

std::string unescape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i >= raw.size()) {
            throw StegoError(ErrorKind::MalformedMetadata, "dangling escape in value");
        }
        switch (raw[i]) {
            case '\\': out += '\\'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case '=':  out += '=';  break;
            default:
                throw StegoError(ErrorKind::MalformedMetadata, "unknown escape in value");
        }
    }
    return out;
}

bool valid_key(const std::string& key) {
    if (key.empty()) return false;
    return key.find_first_of("=\n\r\\") == std::string::npos;
}

} // namespace

// ==================== Metadata ====================

void Metadata::set(const std::string& key, const std::string& value) {
    if (!valid_key(key)) {
        throw std::invalid_argument("metadata key must be non-empty and free of '=', '\\\\' and newlines");
    }
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    entries_.emplace_back(key, value);
}

std::optional<std::string> Metadata::get(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return entry.second;
    }
    return std::nullopt;
}

bool Metadata::contains(const std::string& key) const {
    return get(key).has_value();
}

std::vector<uint8_t> Metadata::serialize() const {
    std::string text = METADATA_HEADER;
    text += '\n';
    for (const auto& [key, value] : entries_) {
        text += key;
        text += '=';
        escape_into(text, value);
        text += '\n';
    }
    return std::vector<uint8_t>(text.begin(), text.end());
}

Metadata Metadata::deserialize(const uint8_t* data, size_t len) {
    if (!data || len == 0) {
        throw StegoError(ErrorKind::MalformedMetadata, "empty metadata block");
    }
    std::string text(reinterpret_cast<const char*>(data), len);

    size_t pos = 0;
    auto next_line = [&](std::string& line) {
        if (pos >= text.size()) return false;
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) {
            line = text.substr(pos);
            pos = text.size();
        } else {
            line = text.substr(pos, nl - pos);
            pos = nl + 1;
        }
        return true;
    };

    std::string line;
    if (!next_line(line) || line != METADATA_HEADER) {
        throw StegoError(ErrorKind::MalformedMetadata, "missing veil-meta header");
    }

    Metadata meta;
    while (next_line(line)) {
        if (line.empty()) continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw StegoError(ErrorKind::MalformedMetadata, "metadata line without '='");
        }
        std::string key = line.substr(0, eq);
        if (!valid_key(key)) {
            throw StegoError(ErrorKind::MalformedMetadata, "invalid metadata key");
        }
        if (meta.contains(key)) {
            throw StegoError(ErrorKind::MalformedMetadata, "duplicate metadata key '" + key + "'");
        }
        meta.entries_.emplace_back(std::move(key), unescape(line.substr(eq + 1)));
    }
    return meta;
}

// ==================== ContainerCodec ====================

std::vector<uint8_t> ContainerCodec::frame(
    const std::vector<uint8_t>& metadata_block,
    const std::vector<uint8_t>& payload)
{
    constexpr size_t max_block = std::numeric_limits<uint32_t>::max();
    if (metadata_block.size() > max_block || payload.size() > max_block) {
        throw std::length_error("container block exceeds 4 GiB length prefix");
    }

    std::vector<uint8_t> out;
    out.reserve(framed_size(metadata_block.size(), payload.size()));
    out.insert(out.end(), CONTAINER_MAGIC, CONTAINER_MAGIC + CONTAINER_MAGIC_LEN);
    put_u32_le(out, static_cast<uint32_t>(metadata_block.size()));
    out.insert(out.end(), metadata_block.begin(), metadata_block.end());
    put_u32_le(out, static_cast<uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

ParsedContainer ContainerCodec::parse(const uint8_t* data, size_t len) {
    if (!data || len < CONTAINER_MAGIC_LEN) {
        throw StegoError(ErrorKind::NoContainerFound, "input shorter than magic");
    }

    const uint8_t* end = data + len;
    const uint8_t* hit = std::search(data, end, CONTAINER_MAGIC, CONTAINER_MAGIC + CONTAINER_MAGIC_LEN);
    if (hit == end) {
        throw StegoError(ErrorKind::NoContainerFound, "magic marker not present");
    }

    ParsedContainer parsed;
    parsed.offset = static_cast<size_t>(hit - data);
    size_t remaining = len - parsed.offset - CONTAINER_MAGIC_LEN;
    const uint8_t* p = hit + CONTAINER_MAGIC_LEN;

    if (remaining < CONTAINER_LENGTH_PREFIX) {
        throw StegoError(ErrorKind::TruncatedContainer, "metadata length missing");
    }
    uint32_t meta_len = get_u32_le(p);
    p += CONTAINER_LENGTH_PREFIX;
    remaining -= CONTAINER_LENGTH_PREFIX;
    if (meta_len > remaining) {
        throw StegoError(ErrorKind::TruncatedContainer, "metadata length exceeds available bytes");
    }
    parsed.metadata.assign(p, p + meta_len);
    p += meta_len;
    remaining -= meta_len;

    if (remaining < CONTAINER_LENGTH_PREFIX) {
        throw StegoError(ErrorKind::TruncatedContainer, "payload length missing");
    }
    uint32_t payload_len = get_u32_le(p);
    p += CONTAINER_LENGTH_PREFIX;
    remaining -= CONTAINER_LENGTH_PREFIX;
    if (payload_len > remaining) {
        throw StegoError(ErrorKind::TruncatedContainer, "payload length exceeds available bytes");
    }
    parsed.payload.assign(p, p + payload_len);
    return parsed;
}

size_t ContainerCodec::required_length(const uint8_t* data, size_t len) {
    size_t need = CONTAINER_MAGIC_LEN + CONTAINER_LENGTH_PREFIX;
    if (len < need) return need;
    if (!magic_at(data)) {
        throw StegoError(ErrorKind::NoContainerFound, "magic marker not at stream start");
    }

    uint64_t meta_len = get_u32_le(data + CONTAINER_MAGIC_LEN);
    uint64_t with_meta = need + meta_len + CONTAINER_LENGTH_PREFIX;
    if (len < with_meta) return static_cast<size_t>(with_meta);

    uint64_t payload_len = get_u32_le(data + with_meta - CONTAINER_LENGTH_PREFIX);
    return static_cast<size_t>(with_meta + payload_len);
}

} // namespace veil
