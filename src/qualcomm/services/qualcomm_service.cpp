#include "qualcomm_service.h"
#include "common/gpt_parser.h"
#include "core/cancellation.h"
#include "transport/i_transport.h"
#include "core/logger.h"

#include <limits>

static const QString TAG = QStringLiteral("QualcommService");

namespace edlkit {

// Sanity bound for a GPT entry array (128 entries of 128 bytes is typical)
static constexpr qint64 MAX_GPT_ENTRY_BYTES = 4 * 1024 * 1024;
// Physical partitions scanned for A/B flags on UFS; eMMC has only LUN 0
static constexpr uint32_t UFS_LUN_COUNT = 6;

QualcommService::QualcommService(ITransport* transport, const EdlConfig& config, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_config(config)
    , m_sahara(std::make_unique<SaharaClient>(transport))
    , m_firehose(std::make_unique<FirehoseClient>(transport))
{
    m_sahara->setTimeouts(config.helloTimeoutMs, config.packetTimeoutMs);
    m_firehose->setTimeouts(config.xmlTimeoutMs, config.dataTimeoutMs);
    m_firehose->setRetryPolicy(config.retryPolicy());
}

QualcommService::~QualcommService() = default;

void QualcommService::setPhase(Phase phase)
{
    if (m_phase != phase) {
        m_phase = phase;
        emit phaseChanged(static_cast<int>(phase));
    }
}

// ─── Session guards ──────────────────────────────────────────────────

bool QualcommService::checkLatched(EdlError& error) const
{
    if (m_fatalError.isError()) {
        error = m_fatalError;
        return false;
    }
    return true;
}

bool QualcommService::requireFirehose(const QString& what, EdlError& error) const
{
    if (!checkLatched(error))
        return false;
    if (m_phase != Phase::Firehose) {
        error = EdlError::usage(what + ": the loader is not running yet");
        return false;
    }
    return true;
}

bool QualcommService::requireConfigured(const QString& what, EdlError& error) const
{
    if (!requireFirehose(what, error))
        return false;
    if (!m_configured) {
        error = EdlError::usage(what + ": configure must be called first");
        return false;
    }
    return true;
}

void QualcommService::latch(const EdlError& error)
{
    if (error.isSessionFatal() && !m_fatalError.isError()) {
        m_fatalError = error;
        LOG_ERROR_CAT(TAG, "Session is unusable: " + error.toString());
    }
}

// ─── Sahara ──────────────────────────────────────────────────────────

SaharaResult QualcommService::readDeviceInfo(const QByteArray& loader)
{
    SaharaResult result;
    if (!checkLatched(result.error))
        return result;
    if (m_phase != Phase::Sahara) {
        result.error = EdlError::usage("Device info is only available in Sahara");
        return result;
    }

    if (!loader.isEmpty())
        m_sahara->setLoader(loader);

    result = m_sahara->readDeviceInfo();
    if (!result.success) {
        latch(result.error);
        return result;
    }

    if (result.state == SaharaState::Done) {
        setPhase(Phase::Firehose);
        m_firehose->pushReceived(m_sahara->takeUnconsumed());
        return result;
    }

    const SaharaDeviceInfo& info = m_sahara->deviceInfo();
    LOG_INFO_CAT(TAG, QString("Device: serial=%1 msm=0x%2 pkhash=%3")
                          .arg(info.serialHex())
                          .arg(info.msmId, 8, 16, QChar('0'))
                          .arg(info.pkHashHex().left(16)));
    return result;
}

SaharaResult QualcommService::uploadLoader(const QByteArray& loader)
{
    SaharaResult result;
    if (!checkLatched(result.error))
        return result;
    if (m_phase != Phase::Sahara) {
        result.error = EdlError::usage("Loader is already running");
        return result;
    }

    LOG_INFO_CAT(TAG, QString("Uploading loader (%1 bytes)").arg(loader.size()));
    m_sahara->setLoader(loader);
    result = m_sahara->uploadLoader();
    if (!result.success) {
        latch(result.error);
        return result;
    }

    setPhase(Phase::Firehose);
    m_firehose->pushReceived(m_sahara->takeUnconsumed());
    LOG_INFO_CAT(TAG, "Loader running, Firehose session open");
    return result;
}

void QualcommService::enterFirehose()
{
    LOG_INFO_CAT(TAG, QString("Direct Firehose session via %1").arg(m_transport->description()));
    setPhase(Phase::Firehose);
}

// ─── Configure ───────────────────────────────────────────────────────

OperationResult QualcommService::configure(const SessionParams& params)
{
    OperationResult result;
    if (!requireFirehose(QStringLiteral("configure"), result.error))
        return result;
    if (m_configured) {
        result.error = EdlError::usage("configure was already called for this session");
        return result;
    }

    result = fromFirehose(m_firehose->configure(params));
    if (result.success) {
        m_configured = true;
        m_partitions.clear();
    }
    return result;
}

// ─── Range operations ────────────────────────────────────────────────

OperationResult QualcommService::read(const PartitionDescriptor& target, const ByteRange& range,
                                      const CancellationToken* cancel)
{
    return runRange(TransferKind::Read, target, range, QByteArray(), cancel);
}

OperationResult QualcommService::write(const PartitionDescriptor& target, const ByteRange& range,
                                       const QByteArray& data, const CancellationToken* cancel)
{
    return runRange(TransferKind::Write, target, range, data, cancel);
}

OperationResult QualcommService::erase(const PartitionDescriptor& target, const ByteRange& range,
                                       const CancellationToken* cancel)
{
    return runRange(TransferKind::Erase, target, range, QByteArray(), cancel);
}

// Byte range of count sectors from startSector; fails when it does not fit a qint64.
bool QualcommService::sectorRange(const QString& what, uint64_t startSector, uint64_t count,
                                  ByteRange& range, EdlError& error) const
{
    if (!requireConfigured(what, error))
        return false;

    const uint64_t ss = session().sectorSize();
    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<qint64>::max()) / ss;
    if (startSector > limit || count > limit - startSector) {
        error = EdlError::usage(QString("%1: sectors %2+%3 lie beyond the addressable range")
                                    .arg(what).arg(startSector).arg(count));
        return false;
    }
    range = { static_cast<qint64>(startSector * ss), static_cast<qint64>(count * ss) };
    return true;
}

OperationResult QualcommService::readSectors(uint32_t lun, uint64_t startSector, uint64_t count,
                                             const CancellationToken* cancel)
{
    OperationResult result;
    ByteRange range;
    if (!sectorRange(QStringLiteral("read"), startSector, count, range, result.error))
        return result;
    return read(PartitionDescriptor::wholeLun(lun), range, cancel);
}

OperationResult QualcommService::writeSectors(uint32_t lun, uint64_t startSector,
                                              const QByteArray& data,
                                              const CancellationToken* cancel)
{
    OperationResult result;
    ByteRange range;
    const uint64_t ss = qMax<uint64_t>(session().sectorSize(), 1);
    const uint64_t count = (static_cast<uint64_t>(data.size()) + ss - 1) / ss;
    if (!sectorRange(QStringLiteral("write"), startSector, count, range, result.error))
        return result;
    range.length = data.size();
    return write(PartitionDescriptor::wholeLun(lun), range, data, cancel);
}

OperationResult QualcommService::eraseSectors(uint32_t lun, uint64_t startSector, uint64_t count,
                                              const CancellationToken* cancel)
{
    OperationResult result;
    ByteRange range;
    if (!sectorRange(QStringLiteral("erase"), startSector, count, range, result.error))
        return result;
    return erase(PartitionDescriptor::wholeLun(lun), range, cancel);
}

OperationResult QualcommService::runRange(TransferKind kind, const PartitionDescriptor& target,
                                          const ByteRange& range, const QByteArray& payload,
                                          const CancellationToken* cancel)
{
    OperationResult result;
    const QString what = TransferPlan::kindName(kind);
    if (!requireConfigured(what, result.error))
        return result;
    if (m_operation) {
        result.error = EdlError::usage(what + ": another operation is in progress");
        return result;
    }
    if (kind == TransferKind::Write && payload.size() != range.length) {
        result.error = EdlError::usage(QString("write: %1 bytes given for a %2-byte range")
                                           .arg(payload.size()).arg(range.length));
        return result;
    }

    const SessionContext& ctx = m_firehose->session();
    const qint64 maxChunk = kind == TransferKind::Read ? ctx.maxPayloadFromTarget()
                                                       : ctx.maxPayloadToTarget();

    m_operation = std::make_unique<Operation>();
    Operation& op = *m_operation;
    op.kind = kind;
    op.target = target;
    op.range = range;
    if (!TransferPlan::build(kind, target, range, ctx.sectorSize(), maxChunk, op.chunks,
                             result.error)) {
        m_operation.reset();
        return result;
    }

    LOG_INFO_CAT(TAG, QString("%1 '%2' lun %3: bytes [%4, %5) in %6 chunk(s)")
                          .arg(what, target.name).arg(target.lun)
                          .arg(range.offset).arg(range.end()).arg(op.chunks.size()));

    qint64 done = 0;
    for (int i = 0; i < op.chunks.size(); i++) {
        TransferChunk& chunk = op.chunks[i];

        if (cancel && cancel->isCancelled()) {
            for (int j = i; j < op.chunks.size(); j++)
                op.chunks[j].outcome = ChunkOutcome::Cancelled;
            LOG_WARNING_CAT(TAG, QString("%1 cancelled after %2 of %3 chunks")
                                     .arg(what).arg(i).arg(op.chunks.size()));
            result.chunks = op.chunks;
            m_operation.reset();
            return finishCancelled(result);
        }

        const QByteArray slice = kind == TransferKind::Write
                                     ? payload.mid(static_cast<int>(chunk.byteOffset - range.offset),
                                                   static_cast<int>(chunk.length))
                                     : QByteArray();
        QByteArray out;
        const FirehoseResult fr = runChunk(op, chunk, slice, out);
        result.attempts = fr.attempts;

        if (!fr.success) {
            chunk.outcome = ChunkOutcome::Failed;
            result.error = fr.error;
            latch(fr.error);
            LOG_ERROR_CAT(TAG, QString("%1 stopped at chunk %2 of %3 (sector %4): %5")
                                   .arg(what).arg(i + 1).arg(op.chunks.size())
                                   .arg(chunk.startSector).arg(fr.error.toString()));
            break;
        }

        chunk.outcome = ChunkOutcome::Succeeded;
        if (kind == TransferKind::Read)
            result.data.append(out);
        done += chunk.length;
        emit transferProgress(done, range.length);
    }

    result.chunks = op.chunks;
    result.success = result.completedChunks() == op.chunks.size();
    m_operation.reset();
    return result;
}

FirehoseResult QualcommService::runChunk(const Operation& op, const TransferChunk& chunk,
                                         const QByteArray& payload, QByteArray& out)
{
    const uint32_t ss = m_firehose->session().sectorSize();
    const uint32_t lun = op.target.lun;

    switch (op.kind) {
    case TransferKind::Read: {
        const FirehoseResult fr = m_firehose->read(
            FirehoseCommand::read(ss, chunk.startSector, chunk.sectorCount, lun, op.target.name));
        if (fr.success) {
            const qint64 skip = TransferPlan::leadingSkip(chunk, op.target, ss);
            out = fr.data.mid(static_cast<int>(skip), static_cast<int>(chunk.length));
        }
        return fr;
    }
    case TransferKind::Write:
        return m_firehose->program(
            FirehoseCommand::program(ss, chunk.startSector, chunk.sectorCount, lun, op.target.name),
            payload);
    case TransferKind::Erase:
        return m_firehose->execute(
            FirehoseCommand::erase(ss, chunk.startSector, chunk.sectorCount, lun));
    }

    FirehoseResult invalid;
    invalid.error = EdlError::usage("Unknown transfer kind");
    return invalid;
}

// Leaves the device in a known state after the caller stopped an operation.
OperationResult QualcommService::finishCancelled(OperationResult result)
{
    result.success = false;
    result.cancelled = true;
    result.error = EdlError::cancelled(
        QString("Cancelled with %1 of %2 chunks completed")
            .arg(result.completedChunks()).arg(result.chunks.size()));

    const OperationResult r = reset();
    if (!r.success) {
        LOG_WARNING_CAT(TAG, "Reset after cancellation failed: " + r.error.toString());
        result.error.message += "; reset failed: " + r.error.message;
    }
    return result;
}

OperationResult QualcommService::fromFirehose(const FirehoseResult& fr)
{
    OperationResult result;
    result.success = fr.success;
    result.error = fr.error;
    result.data = fr.data;
    result.attempts = fr.attempts;
    latch(fr.error);
    return result;
}

OperationResult QualcommService::simpleCommand(const FirehoseCommand& cmd, bool needsConfigure)
{
    OperationResult result;
    const bool ready = needsConfigure ? requireConfigured(cmd.name(), result.error)
                                      : requireFirehose(cmd.name(), result.error);
    if (!ready)
        return result;
    return fromFirehose(m_firehose->execute(cmd));
}

// ─── Memory ──────────────────────────────────────────────────────────

OperationResult QualcommService::peek(uint64_t address, uint32_t length)
{
    OperationResult result;
    if (!requireConfigured(QStringLiteral("peek"), result.error))
        return result;
    if (length == 0) {
        result.error = EdlError::usage("peek: length must be positive");
        return result;
    }
    return fromFirehose(m_firehose->peek(address, length));
}

OperationResult QualcommService::poke(uint64_t address, const QByteArray& bytes,
                                      const CancellationToken* cancel)
{
    OperationResult result;
    if (!requireConfigured(QStringLiteral("poke"), result.error))
        return result;
    if (bytes.isEmpty()) {
        result.error = EdlError::usage("poke: no bytes given");
        return result;
    }

    const int total = static_cast<int>(bytes.size());
    for (int offset = 0; offset < total; offset += FirehoseCommand::MAX_POKE_BYTES) {
        TransferChunk chunk;
        chunk.byteOffset = offset;
        chunk.length = qMin<int>(FirehoseCommand::MAX_POKE_BYTES, total - offset);
        result.chunks.append(chunk);
    }

    for (int i = 0; i < result.chunks.size(); i++) {
        TransferChunk& chunk = result.chunks[i];
        if (cancel && cancel->isCancelled()) {
            for (int j = i; j < result.chunks.size(); j++)
                result.chunks[j].outcome = ChunkOutcome::Cancelled;
            return finishCancelled(result);
        }

        const FirehoseResult fr = m_firehose->execute(FirehoseCommand::poke(
            address + static_cast<uint64_t>(chunk.byteOffset),
            bytes.mid(static_cast<int>(chunk.byteOffset), static_cast<int>(chunk.length))));
        result.attempts = fr.attempts;
        if (!fr.success) {
            chunk.outcome = ChunkOutcome::Failed;
            result.error = fr.error;
            latch(fr.error);
            return result;
        }
        chunk.outcome = ChunkOutcome::Succeeded;
    }

    result.success = true;
    return result;
}

// ─── Partitions / storage ────────────────────────────────────────────

GptParseResult QualcommService::readGpt(uint32_t lun)
{
    GptParseResult result;
    result.lun = lun;

    const OperationResult head = readSectors(lun, 0, 2);
    if (!head.success) {
        result.error = head.error;
        return result;
    }

    const uint32_t ss = session().sectorSize();
    GptHeader header;
    if (!GptParser::parseHeader(head.data.mid(static_cast<int>(ss), static_cast<int>(ss)),
                                header, result.error))
        return result;

    const qint64 entryBytes = GptParser::entryArrayBytes(header);
    if (entryBytes <= 0 || entryBytes > MAX_GPT_ENTRY_BYTES) {
        result.error = EdlError::rejected(QString("GPT on LUN %1 declares %2 bytes of entries")
                                              .arg(lun).arg(entryBytes));
        return result;
    }

    const uint64_t sectors = static_cast<uint64_t>((entryBytes + ss - 1) / ss);
    const uint64_t lbaLimit = static_cast<uint64_t>(std::numeric_limits<qint64>::max()) / ss;
    if (header.partitionEntryLba > lbaLimit - sectors) {
        result.error = EdlError::rejected(QString("GPT entries on LUN %1 at LBA %2 lie outside the disk")
                                              .arg(lun).arg(header.partitionEntryLba));
        return result;
    }

    const OperationResult entries = readSectors(lun, header.partitionEntryLba, sectors);
    if (!entries.success) {
        result.error = entries.error;
        return result;
    }

    result = GptParser::parseEntries(header, entries.data, lun);
    if (result.success)
        m_partitions.insert(lun, result.partitions);
    return result;
}

bool QualcommService::findPartition(const QString& name, uint32_t lun, PartitionDescriptor& out,
                                    EdlError& error)
{
    if (!m_partitions.contains(lun)) {
        const GptParseResult gpt = readGpt(lun);
        if (!gpt.success) {
            error = gpt.error;
            return false;
        }
    }

    for (const PartitionDescriptor& p : m_partitions.value(lun)) {
        if (p.name == name) {
            out = p;
            return true;
        }
    }
    error = EdlError::usage(QString("No partition '%1' on LUN %2").arg(name).arg(lun));
    return false;
}

OperationResult QualcommService::getStorageInfo(uint32_t lun, StorageInfo& info)
{
    OperationResult result;
    if (!requireConfigured(QStringLiteral("getstorageinfo"), result.error))
        return result;

    const FirehoseResult fr = m_firehose->execute(FirehoseCommand::getStorageInfo(lun));
    result = fromFirehose(fr);
    if (!result.success)
        return result;

    info = StorageInfo::fromLogLines(fr.response.logLines);
    if (info.valid) {
        LOG_INFO_CAT(TAG, QString("Storage: %1 %2, %3 blocks of %4 bytes, %5 LUN(s)")
                              .arg(info.memType, info.prodName).arg(info.totalBlocks)
                              .arg(info.blockSize).arg(info.numPhysical));
    } else {
        LOG_WARNING_CAT(TAG, "getstorageinfo ACKed without usable geometry");
    }
    return result;
}

// ─── A/B slots ───────────────────────────────────────────────────────

OperationResult QualcommService::getActiveSlot(QString& slot)
{
    OperationResult result;
    if (!requireConfigured(QStringLiteral("getactiveslot"), result.error))
        return result;

    const bool ufs = session().memoryName().compare(QLatin1String("ufs"), Qt::CaseInsensitive) == 0;
    const uint32_t lunCount = ufs ? UFS_LUN_COUNT : 1;
    bool sawBootPair = false;

    for (uint32_t lun = 0; lun < lunCount; lun++) {
        const GptParseResult gpt = readGpt(lun);
        if (!gpt.success) {
            // LUNs without a usable GPT are skipped
            if (gpt.error.kind == EdlErrorKind::DeviceRejected) {
                LOG_DEBUG_CAT(TAG, QString("LUN %1 skipped: %2").arg(lun).arg(gpt.error.message));
                continue;
            }
            result.error = gpt.error;
            return result;
        }

        for (const PartitionDescriptor& p : gpt.partitions) {
            if (p.name != QLatin1String("boot_a") && p.name != QLatin1String("boot_b"))
                continue;
            sawBootPair = true;
            if (p.isActiveSlot()) {
                slot = p.name.right(1);
                result.success = true;
                LOG_INFO_CAT(TAG, QString("Active slot: %1 (LUN %2)").arg(slot).arg(lun));
                return result;
            }
        }
    }

    result.error = sawBootPair
                       ? EdlError::rejected("Neither boot_a nor boot_b is flagged active")
                       : EdlError::unsupported("No A/B boot partitions found");
    return result;
}

OperationResult QualcommService::setActiveSlot(const QString& slot)
{
    QString s = slot.trimmed().toLower();
    if (s.startsWith(QLatin1Char('_')))
        s.remove(0, 1);
    if (s != QLatin1String("a") && s != QLatin1String("b")) {
        OperationResult result;
        result.error = EdlError::usage(QString("Unknown slot '%1', expected a or b").arg(slot));
        return result;
    }

    LOG_INFO_CAT(TAG, QString("Setting active slot to '%1'").arg(s));
    const OperationResult result = simpleCommand(FirehoseCommand::setActiveSlot(s), true);
    if (result.success)
        m_partitions.clear();
    return result;
}

// ─── Device control ──────────────────────────────────────────────────

OperationResult QualcommService::reset()
{
    // Runs even on a latched session: a reset is how the device is recovered
    OperationResult result;
    m_partitions.clear();

    if (m_phase == Phase::Sahara) {
        const SaharaResult sr = m_sahara->reset();
        result.success = sr.success;
        result.error = sr.error;
        latch(sr.error);
        return result;
    }

    const FirehoseResult fr = m_firehose->execute(FirehoseCommand::power(QStringLiteral("reset")));
    return fromFirehose(fr);
}

OperationResult QualcommService::power(const QString& mode)
{
    const QString m = mode.trimmed().toLower();
    QString value;
    if (m == QLatin1String("reset"))
        value = QStringLiteral("reset");
    else if (m == QLatin1String("off"))
        value = QStringLiteral("off");
    else if (m == QLatin1String("edl"))
        value = QStringLiteral("reset_to_edl");

    if (value.isEmpty()) {
        OperationResult result;
        result.error = EdlError::usage(QString("Unknown power mode '%1'").arg(mode));
        return result;
    }
    return simpleCommand(FirehoseCommand::power(value), false);
}

OperationResult QualcommService::setBootableStorageDrive(uint32_t lun)
{
    return simpleCommand(FirehoseCommand::setBootableStorageDrive(lun), true);
}

OperationResult QualcommService::nop()
{
    return simpleCommand(FirehoseCommand::nop(), false);
}

OperationResult QualcommService::sendRawXml(const QString& xml)
{
    OperationResult result;
    if (!requireFirehose(QStringLiteral("raw XML"), result.error))
        return result;
    return fromFirehose(m_firehose->sendRawXml(xml));
}

} // namespace edlkit
