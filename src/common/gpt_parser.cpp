#include "gpt_parser.h"
#include "crc_utils.h"
#include "core/logger.h"

#include <QtEndian>
#include <cstring>

static const QString TAG = QStringLiteral("GPT");

namespace edlkit {

bool GptParser::parseHeader(const QByteArray& sector, GptHeader& header, EdlError& error)
{
    if (sector.size() < static_cast<int>(MIN_HEADER_SIZE)) {
        error = EdlError::rejected(QString("GPT header sector too small: %1 bytes")
                                       .arg(sector.size()), sector);
        return false;
    }

    const auto* d = reinterpret_cast<const uint8_t*>(sector.constData());
    GptHeader h;
    h.signature = qFromLittleEndian<quint64>(d);
    h.revision = qFromLittleEndian<quint32>(d + 8);
    h.headerSize = qFromLittleEndian<quint32>(d + 12);
    h.headerCrc32 = qFromLittleEndian<quint32>(d + 16);
    h.myLba = qFromLittleEndian<quint64>(d + 24);
    h.alternateLba = qFromLittleEndian<quint64>(d + 32);
    h.firstUsableLba = qFromLittleEndian<quint64>(d + 40);
    h.lastUsableLba = qFromLittleEndian<quint64>(d + 48);
    h.diskGuid = readGuid(d + 56);
    h.partitionEntryLba = qFromLittleEndian<quint64>(d + 72);
    h.numberOfPartitions = qFromLittleEndian<quint32>(d + 80);
    h.partitionEntrySize = qFromLittleEndian<quint32>(d + 84);
    h.partitionEntryCrc32 = qFromLittleEndian<quint32>(d + 88);

    if (h.signature != GPT_SIGNATURE) {
        error = EdlError::rejected("No GPT signature at LBA 1", sector.left(16));
        return false;
    }
    if (h.headerSize < MIN_HEADER_SIZE || h.headerSize > static_cast<uint32_t>(sector.size())) {
        error = EdlError::rejected(QString("Invalid GPT header size %1").arg(h.headerSize));
        return false;
    }
    if (h.partitionEntrySize < MIN_ENTRY_SIZE) {
        error = EdlError::rejected(QString("Invalid GPT entry size %1").arg(h.partitionEntrySize));
        return false;
    }

    // CRC is computed with its own field zeroed
    QByteArray copy = sector.left(static_cast<int>(h.headerSize));
    std::memset(copy.data() + 16, 0, 4);
    const uint32_t computed = Crc32::compute(copy);
    if (computed != h.headerCrc32) {
        error = EdlError::rejected(QString("GPT header CRC mismatch: stored=%1 computed=%2")
                                       .arg(h.headerCrc32, 8, 16, QChar('0'))
                                       .arg(computed, 8, 16, QChar('0')));
        return false;
    }

    header = h;
    return true;
}

qint64 GptParser::entryArrayBytes(const GptHeader& header)
{
    return static_cast<qint64>(header.numberOfPartitions) * header.partitionEntrySize;
}

GptParseResult GptParser::parseEntries(const GptHeader& header, const QByteArray& entries,
                                       uint32_t lun)
{
    GptParseResult result;
    result.header = header;
    result.lun = lun;

    const qint64 needed = entryArrayBytes(header);
    if (entries.size() < needed) {
        result.error = EdlError::rejected(QString("GPT entry array truncated: %1 of %2 bytes")
                                              .arg(entries.size()).arg(needed));
        return result;
    }

    const uint32_t computed = Crc32::compute(entries.left(static_cast<int>(needed)));
    if (computed != header.partitionEntryCrc32) {
        result.error = EdlError::rejected(QString("GPT entry CRC mismatch: stored=%1 computed=%2")
                                              .arg(header.partitionEntryCrc32, 8, 16, QChar('0'))
                                              .arg(computed, 8, 16, QChar('0')));
        return result;
    }

    const auto* d = reinterpret_cast<const uint8_t*>(entries.constData());
    for (uint32_t i = 0; i < header.numberOfPartitions; i++) {
        PartitionDescriptor part = parseEntry(d + static_cast<qint64>(i) * header.partitionEntrySize);
        if (part.typeGuid.isNull())
            continue; // unused slot
        part.lun = lun;
        result.partitions.append(part);
    }

    result.success = true;
    LOG_INFO_CAT(TAG, QString("GPT parsed: %1 partitions on LUN %2")
                          .arg(result.partitions.size()).arg(lun));
    return result;
}

GptParseResult GptParser::parse(const QByteArray& data, uint32_t sectorSize, uint32_t lun)
{
    GptParseResult result;
    result.lun = lun;

    if (sectorSize == 0 || data.size() < static_cast<qint64>(sectorSize) * 2) {
        result.error = EdlError::rejected(QString("GPT needs two %1-byte sectors, got %2 bytes")
                                              .arg(sectorSize).arg(data.size()));
        return result;
    }

    GptHeader header;
    if (!parseHeader(data.mid(static_cast<int>(sectorSize), static_cast<int>(sectorSize)),
                     header, result.error))
        return result;

    if (header.partitionEntryLba > static_cast<uint64_t>(data.size()) / sectorSize) {
        result.error = EdlError::rejected(QString("GPT entries at LBA %1 lie outside the data")
                                              .arg(header.partitionEntryLba));
        return result;
    }
    const qint64 offset = static_cast<qint64>(header.partitionEntryLba) * sectorSize;
    return parseEntries(header, data.mid(static_cast<int>(offset)), lun);
}

PartitionDescriptor GptParser::parseEntry(const uint8_t* data)
{
    PartitionDescriptor p;
    p.typeGuid = readGuid(data);
    if (p.typeGuid.isNull())
        return p;

    p.uniqueGuid = readGuid(data + 16);
    p.startSector = qFromLittleEndian<quint64>(data + 32);
    const uint64_t endSector = qFromLittleEndian<quint64>(data + 40);
    p.sectorCount = (endSector >= p.startSector) ? (endSector - p.startSector + 1) : 0;
    p.attributes = qFromLittleEndian<quint64>(data + 48);

    // UTF-16LE name, up to 36 code units
    for (int i = 0; i < 36; i++) {
        const uint16_t ch = qFromLittleEndian<quint16>(data + 56 + i * 2);
        if (ch == 0)
            break;
        p.name.append(QChar(ch));
    }
    return p;
}

QUuid GptParser::readGuid(const uint8_t* data)
{
    // Mixed-endian: first three fields little-endian, the rest as bytes
    return QUuid(qFromLittleEndian<quint32>(data),
                 qFromLittleEndian<quint16>(data + 4),
                 qFromLittleEndian<quint16>(data + 6),
                 data[8], data[9], data[10], data[11],
                 data[12], data[13], data[14], data[15]);
}

} // namespace edlkit
