#pragma once

#include "common/edl_error.h"
#include "common/partition_info.h"

#include <QList>
#include <QString>
#include <cstdint>

namespace edlkit {

// Byte range relative to the start of a partition.
struct ByteRange {
    qint64 offset = 0;
    qint64 length = 0;

    qint64 end() const { return offset + length; }
};

enum class ChunkOutcome {
    Pending,
    Succeeded,
    Failed,
    Cancelled,
};

// One command's share of an operation. byteOffset/length describe the caller's
// bytes; startSector/sectorCount the absolute sectors the command addresses.
struct TransferChunk {
    qint64 byteOffset = 0;
    qint64 length = 0;
    uint64_t startSector = 0;
    uint64_t sectorCount = 0;
    ChunkOutcome outcome = ChunkOutcome::Pending;

    bool isTerminal() const { return outcome != ChunkOutcome::Pending; }
};

enum class TransferKind {
    Read,
    Write,
    Erase,
};

// ─── Chunk decomposition ─────────────────────────────────────────────
// Reads may start and end anywhere: covering sectors are read and trimmed.
// Writes must start on a sector boundary; the last sector is zero-padded.
// Erases must be sector aligned at both ends.
class TransferPlan {
public:
    static bool build(TransferKind kind, const PartitionDescriptor& target,
                      const ByteRange& range, uint32_t sectorSize, qint64 maxChunkBytes,
                      QList<TransferChunk>& chunks, EdlError& error);

    // Bytes of a read chunk's sector data that belong to the caller.
    static qint64 leadingSkip(const TransferChunk& chunk, const PartitionDescriptor& target,
                              uint32_t sectorSize);

    static int countWithOutcome(const QList<TransferChunk>& chunks, ChunkOutcome outcome);
    static QString kindName(TransferKind kind);
    static QString outcomeName(ChunkOutcome outcome);
};

} // namespace edlkit
