#include "transfer_plan.h"

namespace edlkit {

bool TransferPlan::build(TransferKind kind, const PartitionDescriptor& target,
                         const ByteRange& range, uint32_t sectorSize, qint64 maxChunkBytes,
                         QList<TransferChunk>& chunks, EdlError& error)
{
    chunks.clear();
    const QString what = kindName(kind);

    if (sectorSize == 0) {
        error = EdlError::usage(what + ": sector size is unknown");
        return false;
    }
    if (range.offset < 0 || range.length <= 0) {
        error = EdlError::usage(QString("%1: invalid range offset=%2 length=%3")
                                    .arg(what).arg(range.offset).arg(range.length));
        return false;
    }

    // sectorCount == UINT64_MAX means the whole LUN, bounded by the device only
    if (target.sectorCount != UINT64_MAX) {
        const uint64_t lastSector = (static_cast<uint64_t>(range.end()) + sectorSize - 1) / sectorSize;
        if (lastSector > target.sectorCount) {
            error = EdlError::usage(QString("%1: range [%2, %3) lies outside '%4' (%5 sectors)")
                                        .arg(what).arg(range.offset).arg(range.end())
                                        .arg(target.name).arg(target.sectorCount));
            return false;
        }
    }

    if (kind != TransferKind::Read && range.offset % sectorSize != 0) {
        error = EdlError::usage(QString("%1: offset %2 is not a multiple of %3")
                                    .arg(what).arg(range.offset).arg(sectorSize));
        return false;
    }
    if (kind == TransferKind::Erase && range.length % sectorSize != 0) {
        error = EdlError::usage(QString("%1: length %2 is not a multiple of %3")
                                    .arg(what).arg(range.length).arg(sectorSize));
        return false;
    }

    const qint64 chunkBytes = maxChunkBytes - maxChunkBytes % sectorSize;
    if (chunkBytes <= 0) {
        error = EdlError::unsupported(QString("%1: payload size %2 is below one %3-byte sector")
                                          .arg(what).arg(maxChunkBytes).arg(sectorSize));
        return false;
    }
    const uint64_t sectorsPerChunk = static_cast<uint64_t>(chunkBytes / sectorSize);

    // Walk covering sectors, clipping each chunk to the caller's bytes
    uint64_t sector = static_cast<uint64_t>(range.offset) / sectorSize;
    const uint64_t endSector = (static_cast<uint64_t>(range.end()) + sectorSize - 1) / sectorSize;
    while (sector < endSector) {
        const uint64_t count = qMin(sectorsPerChunk, endSector - sector);
        const qint64 sectorBegin = static_cast<qint64>(sector * sectorSize);
        const qint64 sectorEnd = static_cast<qint64>((sector + count) * sectorSize);

        TransferChunk chunk;
        chunk.byteOffset = qMax(sectorBegin, range.offset);
        chunk.length = qMin(sectorEnd, range.end()) - chunk.byteOffset;
        chunk.startSector = target.startSector + sector;
        chunk.sectorCount = count;
        chunks.append(chunk);

        sector += count;
    }
    return true;
}

qint64 TransferPlan::leadingSkip(const TransferChunk& chunk, const PartitionDescriptor& target,
                                 uint32_t sectorSize)
{
    const qint64 sectorBegin = static_cast<qint64>((chunk.startSector - target.startSector) * sectorSize);
    return chunk.byteOffset - sectorBegin;
}

int TransferPlan::countWithOutcome(const QList<TransferChunk>& chunks, ChunkOutcome outcome)
{
    int n = 0;
    for (const TransferChunk& chunk : chunks) {
        if (chunk.outcome == outcome)
            n++;
    }
    return n;
}

QString TransferPlan::kindName(TransferKind kind)
{
    switch (kind) {
    case TransferKind::Read:  return QStringLiteral("read");
    case TransferKind::Write: return QStringLiteral("write");
    case TransferKind::Erase: return QStringLiteral("erase");
    }
    return QStringLiteral("unknown");
}

QString TransferPlan::outcomeName(ChunkOutcome outcome)
{
    switch (outcome) {
    case ChunkOutcome::Pending:   return QStringLiteral("pending");
    case ChunkOutcome::Succeeded: return QStringLiteral("succeeded");
    case ChunkOutcome::Failed:    return QStringLiteral("failed");
    case ChunkOutcome::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

} // namespace edlkit
