#include "veil_document_codec.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"

#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace veil {

namespace {

const char PDF_EOF[] = "%%EOF";
const char PDF_VEIL_LINE[] = "\n%%VEIL ";
const char XML_OPEN[] = "<!--veil:";
const char XML_CLOSE[] = "-->";

// Zero-width code points, all three bytes long in UTF-8
const char TEXT_MARK[] = "\xE2\x81\xA0";   // U+2060 word joiner
const char TEXT_ONE[] = "\xE2\x80\x8B";    // U+200B zero width space
const char TEXT_ZERO[] = "\xE2\x80\x8C";   // U+200C zero width non-joiner
constexpr size_t TEXT_CHAR_LEN = 3;

constexpr size_t PDF_HEADER_WINDOW = 1024;
constexpr size_t ZIP_EOCD_SIZE = 22;

bool starts_with(const std::vector<uint8_t>& b, size_t at, const char* sig, size_t sig_len) {
    return b.size() >= at + sig_len && std::memcmp(b.data() + at, sig, sig_len) == 0;
}

bool is_space(uint8_t c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Last occurrence of needle in b[0, limit); npos if absent
size_t rfind(const std::vector<uint8_t>& b, const char* needle, size_t needle_len, size_t limit) {
    if (limit > b.size()) limit = b.size();
    if (needle_len > limit) return std::string::npos;
    for (size_t i = limit - needle_len + 1; i-- > 0;) {
        if (std::memcmp(b.data() + i, needle, needle_len) == 0) return i;
    }
    return std::string::npos;
}

size_t trimmed_end(const std::vector<uint8_t>& b) {
    size_t end = b.size();
    while (end > 0 && is_space(b[end - 1])) --end;
    return end;
}

bool sniff_pdf(const std::vector<uint8_t>& b) {
    size_t window = std::min(b.size(), PDF_HEADER_WINDOW);
    return rfind(b, "%PDF-", 5, window) != std::string::npos;
}

bool sniff_xml(const std::vector<uint8_t>& b) {
    size_t i = 0;
    if (starts_with(b, 0, "\xEF\xBB\xBF", 3)) i = 3;
    while (i < b.size() && is_space(b[i])) ++i;
    return i < b.size() && b[i] == '<';
}

// Well-formed UTF-8 with no control characters besides tab, newline, CR and form feed
bool is_utf8_text(const std::vector<uint8_t>& b) {
    size_t i = 0;
    while (i < b.size()) {
        const uint8_t c = b[i];
        if (c < 0x80) {
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f') return false;
            ++i;
            continue;
        }
        size_t extra = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;  // no surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (i + extra >= b.size()) return false;
        if (b[i + 1] < lo || b[i + 1] > hi) return false;
        for (size_t k = 2; k <= extra; ++k) {
            if ((b[i + k] & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

void put_u16_le(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

uint16_t get_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

} // namespace

const char* document_kind_to_string(DocumentKind kind) noexcept {
    switch (kind) {
        case DocumentKind::Pdf: return "pdf";
        case DocumentKind::Zip: return "zip";
        case DocumentKind::Xml: return "xml";
        case DocumentKind::Text: return "text";
    }
    return "unknown";
}

DocumentCodec::DocumentCodec(const std::vector<uint8_t>& bytes, const CodecOptions& options) {
    if (sniff_pdf(bytes)) {
        kind_ = DocumentKind::Pdf;
        locate_pdf(bytes);
        region_capacity_ = std::max(options.document_max_append_bytes, region_.size());
    } else if (starts_with(bytes, 0, "PK\x03\x04", 4) || starts_with(bytes, 0, "PK\x05\x06", 4)) {
        kind_ = DocumentKind::Zip;
        locate_zip(bytes);
        region_capacity_ = ZIP_COMMENT_MAX;
    } else if (starts_with(bytes, 0, "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8)) {
        throw StegoError(ErrorKind::UnsupportedSubformat,
                         "legacy OLE2 documents (.doc/.xls/.ppt) are not supported");
    } else if (starts_with(bytes, 0, "{\\rtf", 5)) {
        throw StegoError(ErrorKind::UnsupportedSubformat, "RTF documents are not supported");
    } else if (sniff_xml(bytes)) {
        kind_ = DocumentKind::Xml;
        locate_xml(bytes);
        region_capacity_ = std::max(options.document_max_append_bytes, region_.size());
    } else if (is_utf8_text(bytes)) {
        kind_ = DocumentKind::Text;
        locate_text(bytes);
        region_capacity_ = std::max(options.document_max_append_bytes, region_.size());
    } else {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat,
                         "unrecognized document format (binary or malformed UTF-8)");
    }

    VEIL_LOG_DEBUG(std::string("[DocumentCodec] ") + document_kind_to_string(kind_) +
                   " region " + std::to_string(region_.size()) + "/" +
                   std::to_string(region_capacity_) + " bytes");
}

void DocumentCodec::locate_pdf(const std::vector<uint8_t>& bytes) {
    const size_t end = trimmed_end(bytes);
    const size_t eof_len = sizeof(PDF_EOF) - 1;
    const size_t veil_len = sizeof(PDF_VEIL_LINE) - 1;

    if (end < eof_len || rfind(bytes, PDF_EOF, eof_len, end) == std::string::npos) {
        throw StegoError(ErrorKind::UnsupportedSubformat, "PDF has no %%EOF trailer");
    }

    // A previous run left: <original>[region]\n%%VEIL <offset>\n%%EOF\n
    if (rfind(bytes, PDF_EOF, eof_len, end) == end - eof_len) {
        size_t veil = rfind(bytes, PDF_VEIL_LINE, veil_len, end - eof_len);
        if (veil != std::string::npos) {
            size_t digits_begin = veil + veil_len;
            size_t digits_end = digits_begin;
            while (digits_end < end && std::isdigit(bytes[digits_end])) ++digits_end;

            bool well_formed = digits_end > digits_begin && digits_end - digits_begin <= 19 &&
                               starts_with(bytes, digits_end, "\n%%EOF", 6) &&
                               digits_end + 6 == end;
            if (well_formed) {
                std::string digits(bytes.begin() + static_cast<std::ptrdiff_t>(digits_begin),
                                   bytes.begin() + static_cast<std::ptrdiff_t>(digits_end));
                unsigned long long offset = std::stoull(digits);
                if (offset <= veil) {
                    prefix_.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
                    region_.assign(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                                   bytes.begin() + static_cast<std::ptrdiff_t>(veil));
                    return;
                }
            }
        }
    }

    prefix_ = bytes;
    if (prefix_.empty() || (prefix_.back() != '\n' && prefix_.back() != '\r')) {
        prefix_.push_back('\n');
    }
    region_.clear();
}

void DocumentCodec::locate_zip(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < ZIP_EOCD_SIZE) {
        throw StegoError(ErrorKind::UnsupportedCarrierFormat, "ZIP shorter than its end record");
    }
    const size_t last = bytes.size() - ZIP_EOCD_SIZE;
    const size_t first = last > ZIP_COMMENT_MAX ? last - ZIP_COMMENT_MAX : 0;
    for (size_t i = last + 1; i-- > first;) {
        if (!starts_with(bytes, i, "PK\x05\x06", 4)) continue;
        size_t comment_len = get_u16_le(bytes.data() + i + 20);
        if (i + ZIP_EOCD_SIZE + comment_len != bytes.size()) continue;

        prefix_.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(i + 20));
        region_.assign(bytes.begin() + static_cast<std::ptrdiff_t>(i + ZIP_EOCD_SIZE), bytes.end());
        return;
    }
    throw StegoError(ErrorKind::UnsupportedCarrierFormat, "ZIP end of central directory not found");
}

void DocumentCodec::locate_xml(const std::vector<uint8_t>& bytes) {
    const size_t end = trimmed_end(bytes);
    const size_t open_len = sizeof(XML_OPEN) - 1;
    const size_t close_len = sizeof(XML_CLOSE) - 1;

    prefix_ = bytes;
    region_.clear();

    if (end < open_len + close_len ||
        std::memcmp(bytes.data() + end - close_len, XML_CLOSE, close_len) != 0) {
        return;
    }
    size_t open = rfind(bytes, XML_OPEN, open_len, end - close_len);
    if (open == std::string::npos) return;

    const char* b64 = reinterpret_cast<const char*>(bytes.data() + open + open_len);
    size_t b64_len = end - close_len - (open + open_len);
    std::vector<uint8_t> decoded(b64_len / 4 * 3 + 3);
    size_t decoded_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(), b64, b64_len,
                          nullptr, &decoded_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        VEIL_LOG_DEBUG("[DocumentCodec] trailing veil comment is not valid base64, ignoring");
        return;
    }
    decoded.resize(decoded_len);

    size_t cut = open;
    if (cut > 0 && bytes[cut - 1] == '\n') --cut;
    prefix_.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
    region_ = std::move(decoded);
}

void DocumentCodec::locate_text(const std::vector<uint8_t>& bytes) {
    prefix_ = bytes;
    region_.clear();

    // Walk back over the zero-width run
    size_t start = bytes.size();
    while (start >= TEXT_CHAR_LEN &&
           (starts_with(bytes, start - TEXT_CHAR_LEN, TEXT_ONE, TEXT_CHAR_LEN) ||
            starts_with(bytes, start - TEXT_CHAR_LEN, TEXT_ZERO, TEXT_CHAR_LEN))) {
        start -= TEXT_CHAR_LEN;
    }
    const size_t chars = (bytes.size() - start) / TEXT_CHAR_LEN;
    if (start < TEXT_CHAR_LEN || !starts_with(bytes, start - TEXT_CHAR_LEN, TEXT_MARK, TEXT_CHAR_LEN) ||
        chars % 8 != 0) {
        return;
    }

    region_.assign(chars / 8, 0);
    for (size_t k = 0; k < chars; ++k) {
        if (starts_with(bytes, start + k * TEXT_CHAR_LEN, TEXT_ONE, TEXT_CHAR_LEN)) {
            region_[k / 8] |= static_cast<uint8_t>(1u << (7 - k % 8));
        }
    }
    prefix_.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(start - TEXT_CHAR_LEN));
}

BitStream DocumentCodec::read_slots(size_t first, size_t count) const {
    if (first > slot_count() || count > slot_count() - first) {
        throw std::out_of_range("document slot range out of bounds");
    }
    BitStream bits(count, 0);
    for (size_t i = 0; i < count; ++i) {
        size_t slot = first + i;
        size_t byte = slot / 8;
        if (byte >= region_.size()) break;
        bits[i] = (region_[byte] >> (7 - slot % 8)) & 1;
    }
    return bits;
}

std::vector<uint8_t> DocumentCodec::write_slots(const std::vector<SlotRun>& runs) const {
    require_runs_fit(runs, slot_count());

    // The previous region is replaced, not patched
    size_t needed = 0;
    for (const auto& run : runs) {
        size_t end_slot = run.first_slot + run.bits.size();
        needed = std::max(needed, (end_slot + 7) / 8);
    }

    std::vector<uint8_t> region(needed, 0);
    for (const auto& run : runs) {
        for (size_t i = 0; i < run.bits.size(); ++i) {
            size_t slot = run.first_slot + i;
            uint8_t mask = static_cast<uint8_t>(1u << (7 - slot % 8));
            if (run.bits[i] & 1) {
                region[slot / 8] |= mask;
            } else {
                region[slot / 8] &= static_cast<uint8_t>(~mask);
            }
        }
    }
    return assemble(region);
}

std::vector<uint8_t> DocumentCodec::assemble(const std::vector<uint8_t>& region) const {
    std::vector<uint8_t> out = prefix_;

    switch (kind_) {
        case DocumentKind::Pdf: {
            out.insert(out.end(), region.begin(), region.end());
            std::string trailer = std::string(PDF_VEIL_LINE) + std::to_string(prefix_.size()) +
                                  "\n" + PDF_EOF + "\n";
            out.insert(out.end(), trailer.begin(), trailer.end());
            break;
        }
        case DocumentKind::Zip: {
            put_u16_le(out, static_cast<uint16_t>(region.size()));
            out.insert(out.end(), region.begin(), region.end());
            break;
        }
        case DocumentKind::Xml: {
            std::string b64(sodium_base64_ENCODED_LEN(region.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
            sodium_bin2base64(&b64[0], b64.size(), region.data(), region.size(),
                              sodium_base64_VARIANT_ORIGINAL);
            b64.resize(std::strlen(b64.c_str()));
            std::string comment = std::string("\n") + XML_OPEN + b64 + XML_CLOSE + "\n";
            out.insert(out.end(), comment.begin(), comment.end());
            break;
        }
        case DocumentKind::Text: {
            out.reserve(out.size() + TEXT_CHAR_LEN * (1 + region.size() * 8));
            out.insert(out.end(), TEXT_MARK, TEXT_MARK + TEXT_CHAR_LEN);
            for (size_t k = 0; k < region.size() * 8; ++k) {
                const char* ch = ((region[k / 8] >> (7 - k % 8)) & 1) ? TEXT_ONE : TEXT_ZERO;
                out.insert(out.end(), ch, ch + TEXT_CHAR_LEN);
            }
            break;
        }
    }
    return out;
}

} // namespace veil
