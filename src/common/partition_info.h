#pragma once

#include <QString>
#include <QList>
#include <QUuid>
#include <cstdint>

#include "edl_error.h"

namespace edlkit {

// A sector range on one physical partition (LUN), optionally named by GPT.
struct PartitionDescriptor {
    QString name;
    uint32_t lun = 0;
    uint64_t startSector = 0;
    uint64_t sectorCount = 0;
    QUuid typeGuid;
    QUuid uniqueGuid;
    uint64_t attributes = 0;

    // A/B slot flags live in attribute byte 6
    static constexpr uint64_t AB_SLOT_ACTIVE = 1ULL << 50;
    static constexpr uint64_t AB_BOOT_SUCCESSFUL = 1ULL << 54;
    static constexpr uint64_t AB_UNBOOTABLE = 1ULL << 55;

    uint64_t sizeBytes(uint32_t sectorSize) const { return sectorCount * sectorSize; }
    bool isActiveSlot() const { return (attributes & AB_SLOT_ACTIVE) != 0; }

    // Whole physical partition, bounded only by the device
    static PartitionDescriptor wholeLun(uint32_t lun)
    {
        PartitionDescriptor p;
        p.lun = lun;
        p.sectorCount = UINT64_MAX;
        return p;
    }
};

struct GptHeader {
    uint64_t signature = 0;
    uint32_t revision = 0;
    uint32_t headerSize = 0;
    uint32_t headerCrc32 = 0;
    uint64_t myLba = 0;
    uint64_t alternateLba = 0;
    uint64_t firstUsableLba = 0;
    uint64_t lastUsableLba = 0;
    QUuid diskGuid;
    uint64_t partitionEntryLba = 0;
    uint32_t numberOfPartitions = 0;
    uint32_t partitionEntrySize = 0;
    uint32_t partitionEntryCrc32 = 0;
};

struct GptParseResult {
    bool success = false;
    EdlError error;
    GptHeader header;
    QList<PartitionDescriptor> partitions;
    uint32_t lun = 0;
};

} // namespace edlkit
