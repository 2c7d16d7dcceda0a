#include "session_context.h"

namespace edlkit {

SessionContext::SessionContext(const QString& memoryName, qint64 maxPayloadToTarget,
                               qint64 maxPayloadFromTarget, uint32_t sectorSize,
                               bool skipStorageInit, const QStringList& supportedFunctions)
    : m_memoryName(memoryName)
    , m_maxPayloadToTarget(maxPayloadToTarget)
    , m_maxPayloadFromTarget(maxPayloadFromTarget)
    , m_sectorSize(sectorSize)
    , m_skipStorageInit(skipStorageInit)
    , m_supportedFunctions(supportedFunctions)
    , m_negotiated(true)
{
}

bool SessionContext::supports(FirehoseVerb verb) const
{
    if (m_supportedFunctions.isEmpty())
        return true;
    return m_supportedFunctions.contains(FirehoseCommand::verbName(verb), Qt::CaseInsensitive);
}

uint32_t SessionContext::defaultSectorSize(const QString& memoryName)
{
    const QString mem = memoryName.toLower();
    if (mem == QLatin1String("ufs") || mem == QLatin1String("nand"))
        return 4096;
    if (mem == QLatin1String("emmc") || mem == QLatin1String("spinor"))
        return 512;
    return 0;
}

} // namespace edlkit
