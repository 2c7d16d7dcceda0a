#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace edlkit {

// Storage geometry reported by <getstorageinfo> in its log lines.
struct StorageInfo {
    bool valid = false;
    uint32_t numPhysical = 0;
    uint32_t blockSize = 0;
    uint64_t totalBlocks = 0;
    QString memType;
    QString prodName;

    uint64_t totalBytes() const { return totalBlocks * blockSize; }

    // Accepts "INFO: {json}" lines (storage_info object) and "key: value" lines.
    static StorageInfo fromLogLines(const QStringList& lines);
};

} // namespace edlkit
