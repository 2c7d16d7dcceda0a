#include "storage_info.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

#include <limits>

namespace edlkit {

namespace {

// Non-negative integer no larger than max; anything else reads as 0
uint64_t jsonNumber(const QJsonValue& value, uint64_t max = std::numeric_limits<uint64_t>::max())
{
    uint64_t n = 0;
    if (value.isDouble()) {
        const double d = value.toDouble();
        // 2^64 is the first double outside uint64_t
        if (!(d >= 0.0) || d >= 18446744073709551616.0)
            return 0;
        n = static_cast<uint64_t>(d);
    } else if (value.isString()) {
        bool ok = false;
        n = value.toString().trimmed().toULongLong(&ok, 0);
        if (!ok)
            return 0;
    }
    return n <= max ? n : 0;
}

void applyKey(StorageInfo& info, const QString& rawKey, const QString& value)
{
    const QString key = rawKey.trimmed().toLower();
    // a bad number leaves the field at 0
    if (key == QLatin1String("num_physical")) {
        info.numPhysical = value.trimmed().toUInt(nullptr, 0);
    } else if (key == QLatin1String("block_size") ||
               key == QLatin1String("sector_size_in_bytes") ||
               key == QLatin1String("sector_size")) {
        info.blockSize = value.trimmed().toUInt(nullptr, 0);
    } else if (key == QLatin1String("total_blocks") ||
               key == QLatin1String("num_partition_sectors")) {
        info.totalBlocks = value.trimmed().toULongLong(nullptr, 0);
    } else if (key == QLatin1String("mem_type")) {
        info.memType = value.trimmed();
    } else if (key == QLatin1String("prod_name")) {
        info.prodName = value.trimmed();
    }
}

void applyJson(StorageInfo& info, const QJsonObject& root)
{
    const QJsonObject obj = root.contains(QLatin1String("storage_info"))
                                ? root.value(QLatin1String("storage_info")).toObject()
                                : root;
    if (obj.contains(QLatin1String("num_physical")))
        info.numPhysical = static_cast<uint32_t>(
            jsonNumber(obj.value(QLatin1String("num_physical")), std::numeric_limits<uint32_t>::max()));
    if (obj.contains(QLatin1String("block_size")))
        info.blockSize = static_cast<uint32_t>(
            jsonNumber(obj.value(QLatin1String("block_size")), std::numeric_limits<uint32_t>::max()));
    if (obj.contains(QLatin1String("total_blocks")))
        info.totalBlocks = jsonNumber(obj.value(QLatin1String("total_blocks")));
    if (obj.contains(QLatin1String("mem_type")))
        info.memType = obj.value(QLatin1String("mem_type")).toString();
    if (obj.contains(QLatin1String("prod_name")))
        info.prodName = obj.value(QLatin1String("prod_name")).toString();
}

} // namespace

StorageInfo StorageInfo::fromLogLines(const QStringList& lines)
{
    StorageInfo info;
    for (const QString& raw : lines) {
        QString line = raw.trimmed();
        if (line.startsWith(QLatin1String("INFO:"), Qt::CaseInsensitive))
            line = line.mid(5).trimmed();

        if (line.startsWith('{')) {
            QJsonParseError parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(line.toUtf8(), &parseError);
            if (parseError.error == QJsonParseError::NoError && doc.isObject())
                applyJson(info, doc.object());
            continue;
        }

        // "key: value" or "key=value"
        int sep = line.indexOf(':');
        if (sep < 0)
            sep = line.indexOf('=');
        if (sep > 0)
            applyKey(info, line.left(sep), line.mid(sep + 1));
    }

    info.valid = info.blockSize != 0 && info.totalBlocks != 0;
    return info;
}

} // namespace edlkit
