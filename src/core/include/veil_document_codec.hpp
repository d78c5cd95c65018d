#pragma once

/**
 * @file veil_document_codec.hpp
 * @brief Embedding in regions that document readers ignore
 *
 *   PDF       bytes appended after the final %%EOF, closed by a
 *             "%%VEIL <offset>" comment line and a fresh %%EOF so readers
 *             that look for the trailer near the end still find one
 *   ZIP/OOXML the end-of-central-directory comment (at most 65535 bytes)
 *   XML/HTML  a trailing <!--veil:BASE64--> comment
 *   Text      any other UTF-8 text: a trailing run of zero-width characters
 *             after a U+2060 word joiner, U+200B for 1 and U+200C for 0,
 *             eight per region byte
 *
 * Slot k is bit (7 - k % 8) of region byte k / 8. Slots past the current
 * region end read as 0, so the slot space is the full region capacity.
 * A write rebuilds the region from the runs alone: bytes of a previous
 * region that the runs do not reach are dropped.
 */

#include "veil_bitstream.hpp"
#include "veil_options.hpp"
#include "veil_redundancy.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace veil {

enum class DocumentKind {
    Pdf,
    Zip,
    Xml,
    Text
};

const char* document_kind_to_string(DocumentKind kind) noexcept;

class DocumentCodec {
public:
    static constexpr size_t ZIP_COMMENT_MAX = 0xFFFF;

    /**
     * Throws StegoError(UnsupportedSubformat) for recognized documents
     * without a usable region (OLE2 .doc/.xls, RTF, PDF without %%EOF) and
     * StegoError(UnsupportedCarrierFormat) for binary or malformed UTF-8.
     */
    DocumentCodec(const std::vector<uint8_t>& bytes, const CodecOptions& options);

    size_t slot_count() const noexcept { return region_capacity_ * 8; }
    BitStream read_slots(size_t first, size_t count) const;
    std::vector<uint8_t> write_slots(const std::vector<SlotRun>& runs) const;

    DocumentKind kind() const noexcept { return kind_; }
    const std::vector<uint8_t>& region() const noexcept { return region_; }
    size_t region_capacity() const noexcept { return region_capacity_; }

private:
    void locate_pdf(const std::vector<uint8_t>& bytes);
    void locate_zip(const std::vector<uint8_t>& bytes);
    void locate_xml(const std::vector<uint8_t>& bytes);
    void locate_text(const std::vector<uint8_t>& bytes);

    std::vector<uint8_t> assemble(const std::vector<uint8_t>& region) const;

    DocumentKind kind_ = DocumentKind::Pdf;
    std::vector<uint8_t> prefix_;   // document bytes before the region
    std::vector<uint8_t> region_;   // current hidden region contents
    size_t region_capacity_ = 0;
};

} // namespace veil
