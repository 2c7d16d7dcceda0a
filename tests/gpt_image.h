#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QUuid>
#include <cstdint>

namespace edlkit {
namespace test {

// Builds a primary GPT (protective MBR sector, header at LBA 1, entry array
// from LBA 2) with valid CRCs.
class GptImage {
public:
    struct Entry {
        QString name;
        uint64_t firstLba = 0;
        uint64_t lastLba = 0;
        QUuid typeGuid;
        QUuid uniqueGuid;
        uint64_t attributes = 0;
    };

    explicit GptImage(uint32_t sectorSize = 512, uint32_t entryCount = 8);

    GptImage& add(const QString& name, uint64_t firstLba, uint64_t lastLba,
                  uint64_t attributes = 0);

    QByteArray build() const;
    uint32_t entryArraySectors() const;

    static QByteArray guidBytes(const QUuid& guid);

private:
    uint32_t m_sectorSize;
    uint32_t m_entryCount;
    QList<Entry> m_entries;
};

} // namespace test
} // namespace edlkit
