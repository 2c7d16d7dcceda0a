#pragma once

#include "firehose_xml.h"

#include <QString>
#include <QStringList>
#include <cstdint>

namespace edlkit {

// Parameters the host asks for in <configure>.
struct SessionParams {
    QString memoryName = QStringLiteral("ufs");
    qint64 maxPayloadToTarget = 1048576;
    qint64 maxPayloadFromTarget = 1048576;
    uint32_t sectorSize = 0;        // 0: derived from memoryName
    bool skipStorageInit = false;
};

// Parameters in force after <configure> was acknowledged. A default-constructed
// context means nothing has been negotiated yet.
class SessionContext {
public:
    SessionContext() = default;
    SessionContext(const QString& memoryName, qint64 maxPayloadToTarget,
                   qint64 maxPayloadFromTarget, uint32_t sectorSize, bool skipStorageInit,
                   const QStringList& supportedFunctions = QStringList());

    bool isNegotiated() const { return m_negotiated; }

    const QString& memoryName() const { return m_memoryName; }
    qint64 maxPayloadToTarget() const { return m_maxPayloadToTarget; }
    qint64 maxPayloadFromTarget() const { return m_maxPayloadFromTarget; }
    uint32_t sectorSize() const { return m_sectorSize; }
    bool skipStorageInit() const { return m_skipStorageInit; }
    const QStringList& supportedFunctions() const { return m_supportedFunctions; }

    // True when the loader did not advertise its functions or lists this verb.
    bool supports(FirehoseVerb verb) const;

    // ufs/nand: 4096, emmc/spinor: 512, anything else: 0
    static uint32_t defaultSectorSize(const QString& memoryName);

private:
    QString m_memoryName;
    qint64 m_maxPayloadToTarget = 0;
    qint64 m_maxPayloadFromTarget = 0;
    uint32_t m_sectorSize = 0;
    bool m_skipStorageInit = false;
    QStringList m_supportedFunctions;
    bool m_negotiated = false;
};

} // namespace edlkit
