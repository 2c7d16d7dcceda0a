#pragma once

#include <QObject>
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QString>
#include <memory>

#include "common/edl_error.h"
#include "common/partition_info.h"
#include "core/edl_config.h"
#include "qualcomm/protocol/firehose_client.h"
#include "qualcomm/protocol/sahara_protocol.h"
#include "qualcomm/services/storage_info.h"
#include "qualcomm/services/transfer_plan.h"

namespace edlkit {

class ITransport;
class CancellationToken;

// Outcome of one orchestrated request. On failure, chunks tells which parts of
// the range reached the device and which did not.
struct OperationResult {
    bool success = false;
    EdlError error;
    QList<TransferChunk> chunks;
    QByteArray data;              // read/peek payload, in range order
    bool cancelled = false;
    int attempts = 0;             // attempts of the last command issued

    int completedChunks() const
    {
        return TransferPlan::countWithOutcome(chunks, ChunkOutcome::Succeeded);
    }
};

// ─── High-level Qualcomm EDL service ─────────────────────────────────
// Owns the Sahara and Firehose engines of one device session. All calls block
// until their exchange completes; one operation runs at a time.
class QualcommService : public QObject {
    Q_OBJECT

public:
    enum class Phase {
        Sahara,
        Firehose,
    };

    explicit QualcommService(ITransport* transport, const EdlConfig& config = EdlConfig(),
                             QObject* parent = nullptr);
    ~QualcommService() override;

    Phase phase() const { return m_phase; }
    bool isConfigured() const { return m_configured; }
    const SessionContext& session() const { return m_firehose->session(); }
    // First TransportError or ProtocolViolation; every later call returns it.
    const EdlError& fatalError() const { return m_fatalError; }

    // ── Sahara ───────────────────────────────────────────────────────
    // A device may decline command mode and pull the loader right away, so the
    // loader can be supplied here too; the session is then in Firehose.
    SaharaResult readDeviceInfo(const QByteArray& loader = QByteArray());
    const SaharaDeviceInfo& deviceInfo() const { return m_sahara->deviceInfo(); }
    // Uploads the loader and switches the session to Firehose.
    SaharaResult uploadLoader(const QByteArray& loader);
    // For a device whose loader is already running.
    void enterFirehose();

    // ── Firehose session ─────────────────────────────────────────────
    // Exactly once per session, before any data operation.
    OperationResult configure(const SessionParams& params);

    // ── Range operations (bytes relative to the partition start) ─────
    OperationResult read(const PartitionDescriptor& target, const ByteRange& range,
                         const CancellationToken* cancel = nullptr);
    OperationResult write(const PartitionDescriptor& target, const ByteRange& range,
                          const QByteArray& data, const CancellationToken* cancel = nullptr);
    OperationResult erase(const PartitionDescriptor& target, const ByteRange& range,
                          const CancellationToken* cancel = nullptr);

    OperationResult readSectors(uint32_t lun, uint64_t startSector, uint64_t count,
                                const CancellationToken* cancel = nullptr);
    OperationResult writeSectors(uint32_t lun, uint64_t startSector, const QByteArray& data,
                                 const CancellationToken* cancel = nullptr);
    OperationResult eraseSectors(uint32_t lun, uint64_t startSector, uint64_t count,
                                 const CancellationToken* cancel = nullptr);

    // ── Memory ───────────────────────────────────────────────────────
    OperationResult peek(uint64_t address, uint32_t length);
    // Split into 8-byte pokes.
    OperationResult poke(uint64_t address, const QByteArray& bytes,
                         const CancellationToken* cancel = nullptr);

    // ── Partitions / storage ─────────────────────────────────────────
    GptParseResult readGpt(uint32_t lun = 0);
    bool findPartition(const QString& name, uint32_t lun, PartitionDescriptor& out,
                       EdlError& error);
    OperationResult getStorageInfo(uint32_t lun, StorageInfo& info);

    // ── A/B slots ("a" or "b") ───────────────────────────────────────
    // Scans the GPT of every LUN of the memory for boot_a/boot_b and reports
    // the one flagged active.
    OperationResult getActiveSlot(QString& slot);
    // The loader rewrites the slot flags of every A/B partition pair.
    OperationResult setActiveSlot(const QString& slot);

    // ── Device control ───────────────────────────────────────────────
    // Sahara Reset before the loader runs, <power value="reset"/> after.
    OperationResult reset();
    OperationResult power(const QString& mode);
    OperationResult setBootableStorageDrive(uint32_t lun);
    OperationResult nop();
    OperationResult sendRawXml(const QString& xml);

    SaharaClient* saharaClient() { return m_sahara.get(); }
    FirehoseClient* firehoseClient() { return m_firehose.get(); }

signals:
    void transferProgress(qint64 done, qint64 total);
    void phaseChanged(int phase);

private:
    struct Operation {
        TransferKind kind = TransferKind::Read;
        PartitionDescriptor target;
        ByteRange range;
        QList<TransferChunk> chunks;
    };

    bool checkLatched(EdlError& error) const;
    bool requireFirehose(const QString& what, EdlError& error) const;
    bool requireConfigured(const QString& what, EdlError& error) const;
    void latch(const EdlError& error);
    bool sectorRange(const QString& what, uint64_t startSector, uint64_t count,
                     ByteRange& range, EdlError& error) const;
    void setPhase(Phase phase);

    OperationResult runRange(TransferKind kind, const PartitionDescriptor& target,
                             const ByteRange& range, const QByteArray& payload,
                             const CancellationToken* cancel);
    FirehoseResult runChunk(const Operation& op, const TransferChunk& chunk,
                            const QByteArray& payload, QByteArray& out);
    OperationResult finishCancelled(OperationResult result);
    OperationResult fromFirehose(const FirehoseResult& fr);
    OperationResult simpleCommand(const FirehoseCommand& cmd, bool needsConfigure);

    ITransport* m_transport = nullptr;
    EdlConfig m_config;
    std::unique_ptr<SaharaClient> m_sahara;
    std::unique_ptr<FirehoseClient> m_firehose;
    std::unique_ptr<Operation> m_operation;

    Phase m_phase = Phase::Sahara;
    bool m_configured = false;
    EdlError m_fatalError;
    QMap<uint32_t, QList<PartitionDescriptor>> m_partitions;
};

} // namespace edlkit
