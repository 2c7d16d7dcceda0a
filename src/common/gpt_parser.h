#pragma once

#include "partition_info.h"
#include <QByteArray>

namespace edlkit {

class GptParser {
public:
    static constexpr uint64_t GPT_SIGNATURE = 0x5452415020494645ULL; // "EFI PART"
    static constexpr uint32_t MIN_HEADER_SIZE = 92;
    static constexpr uint32_t MIN_ENTRY_SIZE = 128;

    // Validates signature, header size and header CRC of the sector at LBA 1.
    static bool parseHeader(const QByteArray& sector, GptHeader& header, EdlError& error);

    // Size of the entry array the header describes.
    static qint64 entryArrayBytes(const GptHeader& header);

    // Validates the entry array CRC and returns the non-empty entries.
    static GptParseResult parseEntries(const GptHeader& header, const QByteArray& entries,
                                       uint32_t lun);

    // data starts at LBA 0 and covers at least the primary entry array.
    static GptParseResult parse(const QByteArray& data, uint32_t sectorSize, uint32_t lun = 0);

private:
    static PartitionDescriptor parseEntry(const uint8_t* data);
    static QUuid readGuid(const uint8_t* data);
};

} // namespace edlkit
