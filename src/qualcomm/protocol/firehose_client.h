#pragma once

#include "firehose_xml.h"
#include "session_context.h"
#include "common/edl_error.h"
#include "common/retry_policy.h"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <functional>

namespace edlkit {

class ITransport;

struct FirehoseResult {
    bool success = false;
    EdlError error;
    FirehoseResponse response;   // final response, with every log line of the exchange
    QByteArray data;             // read payload or peeked bytes
    int attempts = 0;
};

// ─── Firehose client ────────────────────────────────────────────────
// One command in flight at a time. Every exchange goes through the retry policy;
// the data phase of program/read happens inside each attempt.
class FirehoseClient : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_XML_TIMEOUT_MS = 10000;
    static constexpr int DEFAULT_DATA_TIMEOUT_MS = 60000;

    explicit FirehoseClient(ITransport* transport, QObject* parent = nullptr);

    void setRetryPolicy(const RetryPolicy& policy) { m_policy = policy; }
    const RetryPolicy& retryPolicy() const { return m_policy; }
    void setTimeouts(int xmlMs, int dataMs);

    // Bytes a previous protocol layer read past its last packet.
    void pushReceived(const QByteArray& bytes);

    // ── Configuration ────────────────────────────────────────────────
    // Negotiates payload sizes; the device may lower either one.
    FirehoseResult configure(const SessionParams& params);
    const SessionContext& session() const { return m_session; }

    // ── Command execution ────────────────────────────────────────────
    // Non-data verbs. program/read must go through their own calls.
    FirehoseResult execute(const FirehoseCommand& cmd);
    // Payload is zero-padded to num_partition_sectors * SECTOR_SIZE_IN_BYTES.
    FirehoseResult program(const FirehoseCommand& cmd, const QByteArray& payload);
    FirehoseResult read(const FirehoseCommand& cmd);

    // Memory bytes arrive as hex in <log> lines.
    FirehoseResult peek(uint64_t address, uint32_t size);
    // Caller-built XML, classified like any other response.
    FirehoseResult sendRawXml(const QString& xml);

    static QByteArray decodePeekLines(const QStringList& logLines);
    static QStringList parseSupportedFunctions(const QStringList& logLines);

signals:
    void deviceLog(const QString& line);
    void transferProgress(qint64 done, qint64 total);

private:
    using Attempt = std::function<FirehoseResult(int attempt)>;

    FirehoseResult run(const QString& what, const Attempt& attempt);
    void discardStale();
    bool precheck(const FirehoseCommand& cmd, FirehoseResult& result) const;
    FirehoseResult exchange(const QByteArray& xml, const QString& what);
    bool finish(FirehoseResult& result, int timeoutMs, const QString& what);

    bool sendXml(const QByteArray& xml, EdlError& error);
    bool awaitResponse(int timeoutMs, FirehoseResponse& response, EdlError& error);
    bool writeData(const QByteArray& payload, qint64 chunkSize, EdlError& error);
    bool readData(qint64 size, QByteArray& out, EdlError& error);
    static EdlError nakError(const QString& what, const FirehoseResponse& response);

    ITransport* m_transport = nullptr;
    RetryPolicy m_policy;
    SessionContext m_session;
    FirehoseResponseParser m_parser;

    int m_xmlTimeoutMs = DEFAULT_XML_TIMEOUT_MS;
    int m_dataTimeoutMs = DEFAULT_DATA_TIMEOUT_MS;

    static constexpr int READ_CHUNK = 16384;
    static constexpr int STALE_QUIET_MS = 100;
};

} // namespace edlkit
