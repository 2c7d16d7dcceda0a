#include "firehose_client.h"
#include "transport/i_transport.h"
#include "core/logger.h"

static const QString TAG = QStringLiteral("Firehose");

namespace edlkit {

FirehoseClient::FirehoseClient(ITransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
{
    Q_ASSERT(transport);
}

void FirehoseClient::setTimeouts(int xmlMs, int dataMs)
{
    m_xmlTimeoutMs = xmlMs;
    m_dataTimeoutMs = dataMs;
}

void FirehoseClient::pushReceived(const QByteArray& bytes)
{
    if (!bytes.isEmpty())
        m_parser.feed(bytes);
}

// ─── Communication ───────────────────────────────────────────────────

bool FirehoseClient::sendXml(const QByteArray& xml, EdlError& error)
{
    LOG_DEBUG_CAT(TAG, "TX " + QString::fromUtf8(xml));
    const qint64 written = m_transport->write(xml, m_xmlTimeoutMs);
    if (written != xml.size()) {
        error = EdlError::transport(QString("Failed to send XML command (%1 of %2 bytes, %3)")
                                        .arg(written).arg(xml.size())
                                        .arg(transportStatusName(m_transport->status())));
        return false;
    }
    return true;
}

bool FirehoseClient::awaitResponse(int timeoutMs, FirehoseResponse& response, EdlError& error)
{
    response = FirehoseResponse();

    while (true) {
        FirehoseElement element;
        const FirehoseParseStatus status = m_parser.next(element, error);

        if (status == FirehoseParseStatus::Malformed)
            return false;

        if (status == FirehoseParseStatus::NeedMore) {
            const QByteArray chunk = m_transport->read(READ_CHUNK, timeoutMs);
            if (chunk.isEmpty()) {
                const TransportStatus ts = m_transport->status();
                if (ts == TransportStatus::Closed || ts == TransportStatus::IoError) {
                    error = EdlError::transport("Read failed: " + transportStatusName(ts));
                } else {
                    error = EdlError::timeout(
                        QString("No response within %1 ms").arg(timeoutMs));
                }
                return false;
            }
            m_parser.feed(chunk);
            continue;
        }

        if (element.name == QLatin1String("log")) {
            const QString line = element.attributes.value(QStringLiteral("value"));
            response.logLines.append(line);
            LOG_DEBUG_CAT(TAG, "[Device] " + line);
            emit deviceLog(line);
        } else if (element.name == QLatin1String("response")) {
            const QString value = element.attributes.value(QStringLiteral("value"));
            if (value.compare(QLatin1String("ACK"), Qt::CaseInsensitive) == 0) {
                response.outcome = FirehoseOutcome::Ack;
            } else if (value.compare(QLatin1String("NAK"), Qt::CaseInsensitive) == 0) {
                response.outcome = FirehoseOutcome::Nak;
                response.reason = element.attributes.value(QStringLiteral("reason"));
                if (response.reason.isEmpty() && !response.logLines.isEmpty())
                    response.reason = response.logLines.last();
            } else {
                error = EdlError::protocol(
                    QString("Response value '%1' is neither ACK nor NAK").arg(value));
                return false;
            }
            response.attributes = element.attributes;
            return true;
        } else {
            LOG_WARNING_CAT(TAG, QString("Ignoring unexpected <%1> element").arg(element.name));
        }
    }
}

bool FirehoseClient::writeData(const QByteArray& payload, qint64 chunkSize, EdlError& error)
{
    const qint64 total = payload.size();
    for (qint64 offset = 0; offset < total; offset += chunkSize) {
        const QByteArray chunk = payload.mid(static_cast<int>(offset),
                                             static_cast<int>(qMin(chunkSize, total - offset)));
        const qint64 written = m_transport->write(chunk, m_dataTimeoutMs);
        if (written != chunk.size()) {
            error = EdlError::transport(QString("Data phase stalled at byte %1 of %2 (%3)")
                                            .arg(offset + qMax<qint64>(written, 0)).arg(total)
                                            .arg(transportStatusName(m_transport->status())));
            return false;
        }
        emit transferProgress(offset + chunk.size(), total);
    }
    return true;
}

bool FirehoseClient::readData(qint64 size, QByteArray& out, EdlError& error)
{
    // Raw data may already sit behind the ACK in the parser buffer
    out = m_parser.takeRemainder();
    while (out.size() < size) {
        const qint64 want = qMax<qint64>(READ_CHUNK, qMin<qint64>(size - out.size(), 1 << 24));
        const QByteArray chunk = m_transport->read(static_cast<int>(want), m_dataTimeoutMs);
        if (chunk.isEmpty()) {
            error = EdlError::transport(QString("Data phase stalled after %1 of %2 bytes (%3)")
                                            .arg(out.size()).arg(size)
                                            .arg(transportStatusName(m_transport->status())));
            return false;
        }
        out.append(chunk);
        emit transferProgress(qMin<qint64>(out.size(), size), size);
    }

    // Anything past the payload is the closing response
    if (out.size() > size) {
        m_parser.feed(out.mid(static_cast<int>(size)));
        out.truncate(static_cast<int>(size));
    }
    return true;
}

EdlError FirehoseClient::nakError(const QString& what, const FirehoseResponse& response)
{
    return EdlError::rejected(
        QString("%1 NAK%2").arg(what, response.reason.isEmpty() ? QString()
                                                                 : ": " + response.reason));
}

// ─── Exchange plumbing ───────────────────────────────────────────────

// Drops whatever an earlier attempt left behind: partial documents in the parser and
// any late reply still arriving.
void FirehoseClient::discardStale()
{
    qint64 dropped = m_parser.pendingBytes();
    m_parser.reset();

    const int quietMs = qMin(m_xmlTimeoutMs, STALE_QUIET_MS);
    while (true) {
        const QByteArray chunk = m_transport->read(READ_CHUNK, quietMs);
        if (chunk.isEmpty())
            break;
        dropped += chunk.size();
    }
    if (dropped > 0)
        LOG_WARNING_CAT(TAG, QString("Discarded %1 stale bytes before retry").arg(dropped));
}

FirehoseResult FirehoseClient::run(const QString& what, const Attempt& attempt)
{
    FirehoseResult result = m_policy.run<FirehoseResult>(what, [&](int n) {
        if (n > 0)
            discardStale();
        return attempt(n);
    });
    if (result.error.isSessionFatal())
        m_parser.reset();
    return result;
}

bool FirehoseClient::precheck(const FirehoseCommand& cmd, FirehoseResult& result) const
{
    if (!cmd.isValid()) {
        result.error = EdlError::usage("Invalid Firehose command");
        return false;
    }
    if (!m_session.supports(cmd.verb())) {
        result.error = EdlError::unsupported(
            QString("Loader does not support <%1>").arg(cmd.name()));
        return false;
    }
    return true;
}

FirehoseResult FirehoseClient::exchange(const QByteArray& xml, const QString& what)
{
    FirehoseResult result;
    if (!sendXml(xml, result.error))
        return result;
    if (!awaitResponse(m_xmlTimeoutMs, result.response, result.error))
        return result;
    if (!result.response.isAck()) {
        result.error = nakError(what, result.response);
        return result;
    }
    result.success = true;
    return result;
}

// Waits for the response closing a data phase and folds it into result.
bool FirehoseClient::finish(FirehoseResult& result, int timeoutMs, const QString& what)
{
    FirehoseResponse closing;
    if (!awaitResponse(timeoutMs, closing, result.error)) {
        result.success = false;
        return false;
    }

    closing.logLines = result.response.logLines + closing.logLines;
    result.response = closing;
    if (!closing.isAck()) {
        result.success = false;
        result.error = nakError(what, closing);
        return false;
    }
    return true;
}

// ─── Configure ───────────────────────────────────────────────────────

QStringList FirehoseClient::parseSupportedFunctions(const QStringList& logLines)
{
    QStringList functions;
    bool inList = false;
    for (const QString& raw : logLines) {
        QString line = raw.simplified();
        if (line.startsWith(QLatin1String("INFO:"), Qt::CaseInsensitive))
            line = line.mid(5).trimmed();

        const int header = line.indexOf(QLatin1String("Supported Functions"), 0, Qt::CaseInsensitive);
        if (line.startsWith(QLatin1String("End of supported functions"), Qt::CaseInsensitive)) {
            inList = false;
        } else if (header >= 0) {
            inList = true;
            const int colon = line.indexOf(':', header);
            if (colon >= 0)
                functions += line.mid(colon + 1).toLower().split(' ', Qt::SkipEmptyParts);
        } else if (inList) {
            functions += line.toLower().split(' ', Qt::SkipEmptyParts);
        }
    }
    return functions;
}

FirehoseResult FirehoseClient::configure(const SessionParams& params)
{
    FirehoseResult result;
    const uint32_t sectorSize = params.sectorSize != 0
                                    ? params.sectorSize
                                    : SessionContext::defaultSectorSize(params.memoryName);
    if (sectorSize == 0) {
        result.error = EdlError::usage(
            QString("Unknown memory '%1' and no sector size given").arg(params.memoryName));
        return result;
    }
    if (params.maxPayloadToTarget <= 0 || params.maxPayloadFromTarget <= 0) {
        result.error = EdlError::usage("Payload sizes must be positive");
        return result;
    }

    LOG_INFO_CAT(TAG, QString("Configuring: memory=%1, payload=%2, sector=%3")
                          .arg(params.memoryName).arg(params.maxPayloadToTarget).arg(sectorSize));

    qint64 toTarget = params.maxPayloadToTarget;
    result = run(QStringLiteral("configure"), [&](int) {
        FirehoseResult r = exchange(
            FirehoseCommand::configure(params.memoryName, toTarget, params.skipStorageInit).toXml(),
            QStringLiteral("configure"));

        // A NAK may carry the payload size the loader accepts; ask once more with it
        if (!r.success && r.error.kind == EdlErrorKind::DeviceRejected) {
            const qint64 offered = r.response.attribute(
                QStringLiteral("MaxPayloadSizeToTargetInBytes")).toLongLong();
            if (offered > 0 && offered < toTarget) {
                LOG_INFO_CAT(TAG, QString("Device counter-offered payload size %1").arg(offered));
                toTarget = offered;
                const QStringList earlier = r.response.logLines;
                r = exchange(FirehoseCommand::configure(params.memoryName, toTarget,
                                                        params.skipStorageInit).toXml(),
                             QStringLiteral("configure"));
                r.response.logLines = earlier + r.response.logLines;
            }
        }
        return r;
    });
    if (!result.success)
        return result;

    const qint64 ackTo = result.response.attribute(
        QStringLiteral("MaxPayloadSizeToTargetInBytes")).toLongLong();
    if (ackTo > 0 && ackTo < toTarget)
        toTarget = ackTo;

    qint64 fromTarget = params.maxPayloadFromTarget;
    const qint64 ackFrom = result.response.attribute(
        QStringLiteral("MaxPayloadSizeFromTargetInBytes")).toLongLong();
    if (ackFrom > 0 && ackFrom < fromTarget)
        fromTarget = ackFrom;

    m_session = SessionContext(params.memoryName, toTarget, fromTarget, sectorSize,
                               params.skipStorageInit,
                               parseSupportedFunctions(result.response.logLines));

    LOG_INFO_CAT(TAG, QString("Firehose configured: to-target=%1 from-target=%2 sector=%3")
                          .arg(toTarget).arg(fromTarget).arg(sectorSize));
    if (!m_session.supportedFunctions().isEmpty()) {
        LOG_INFO_CAT(TAG, "Supported functions: " +
                              m_session.supportedFunctions().join(QLatin1Char(' ')));
    }
    return result;
}

// ─── Commands ────────────────────────────────────────────────────────

FirehoseResult FirehoseClient::execute(const FirehoseCommand& cmd)
{
    FirehoseResult result;
    if (cmd.verb() == FirehoseVerb::Program || cmd.verb() == FirehoseVerb::Read) {
        result.error = EdlError::usage(
            QString("<%1> carries a data phase, use its own call").arg(cmd.name()));
        return result;
    }
    if (!precheck(cmd, result))
        return result;

    const QByteArray xml = cmd.toXml();
    return run(cmd.name(), [&](int) { return exchange(xml, cmd.name()); });
}

FirehoseResult FirehoseClient::program(const FirehoseCommand& cmd, const QByteArray& payload)
{
    FirehoseResult result;
    if (cmd.verb() != FirehoseVerb::Program) {
        result.error = EdlError::usage("program() needs a <program> command");
        return result;
    }
    if (!precheck(cmd, result))
        return result;

    const qint64 sectorSize = static_cast<qint64>(cmd.intAttribute(QStringLiteral("SECTOR_SIZE_IN_BYTES")));
    const qint64 total = sectorSize *
                         static_cast<qint64>(cmd.intAttribute(QStringLiteral("num_partition_sectors")));
    if (payload.size() > total) {
        result.error = EdlError::usage(QString("Payload of %1 bytes exceeds the %2 bytes addressed")
                                           .arg(payload.size()).arg(total));
        return result;
    }

    qint64 chunkSize = m_session.isNegotiated() ? m_session.maxPayloadToTarget() : total;
    chunkSize -= chunkSize % sectorSize;
    if (chunkSize <= 0) {
        result.error = EdlError::unsupported(
            QString("Payload size %1 is below one %2-byte sector")
                .arg(m_session.maxPayloadToTarget()).arg(sectorSize));
        return result;
    }

    QByteArray padded = payload;
    padded.append(QByteArray(static_cast<int>(total - payload.size()), '\0'));

    const QByteArray xml = cmd.toXml();
    return run(cmd.name(), [&](int) {
        FirehoseResult r = exchange(xml, cmd.name());
        if (!r.success)
            return r;
        if (!writeData(padded, chunkSize, r.error)) {
            r.success = false;
            return r;
        }
        finish(r, m_dataTimeoutMs, cmd.name());
        return r;
    });
}

FirehoseResult FirehoseClient::read(const FirehoseCommand& cmd)
{
    FirehoseResult result;
    if (cmd.verb() != FirehoseVerb::Read) {
        result.error = EdlError::usage("read() needs a <read> command");
        return result;
    }
    if (!precheck(cmd, result))
        return result;

    const qint64 expected =
        static_cast<qint64>(cmd.intAttribute(QStringLiteral("SECTOR_SIZE_IN_BYTES"))) *
        static_cast<qint64>(cmd.intAttribute(QStringLiteral("num_partition_sectors")));

    const QByteArray xml = cmd.toXml();
    return run(cmd.name(), [&](int) {
        FirehoseResult r = exchange(xml, cmd.name());
        if (!r.success)
            return r;
        if (!readData(expected, r.data, r.error)) {
            r.success = false;
            r.data.clear();
            return r;
        }
        if (!finish(r, m_xmlTimeoutMs, cmd.name()))
            r.data.clear();
        return r;
    });
}

// ─── Peek / raw XML ──────────────────────────────────────────────────

QByteArray FirehoseClient::decodePeekLines(const QStringList& logLines)
{
    QByteArray out;
    for (const QString& line : logLines) {
        const QStringList tokens = line.simplified().split(' ', Qt::SkipEmptyParts);
        QByteArray bytes;
        bool allHex = !tokens.isEmpty();
        for (const QString& token : tokens) {
            const QString digits = token.startsWith(QLatin1String("0x"), Qt::CaseInsensitive)
                                       ? token.mid(2) : token;
            bool ok = false;
            const uint value = digits.toUInt(&ok, 16);
            if (!ok || digits.size() != 2) {
                allHex = false;
                break;
            }
            bytes.append(static_cast<char>(value));
        }
        if (allHex)
            out.append(bytes);
    }
    return out;
}

FirehoseResult FirehoseClient::peek(uint64_t address, uint32_t size)
{
    FirehoseResult result = execute(FirehoseCommand::peek(address, size));
    if (!result.success)
        return result;

    result.data = decodePeekLines(result.response.logLines);
    if (result.data.size() < static_cast<int>(size)) {
        result.success = false;
        result.error = EdlError::rejected(
            QString("peek at 0x%1 returned %2 of %3 bytes")
                .arg(address, 0, 16).arg(result.data.size()).arg(size));
        result.data.clear();
        return result;
    }
    result.data.truncate(static_cast<int>(size));
    return result;
}

FirehoseResult FirehoseClient::sendRawXml(const QString& xml)
{
    FirehoseResult result;
    QList<FirehoseElement> elements;
    if (!FirehoseResponseParser::parseFragment(xml.toUtf8(), elements, result.error)) {
        result.error = EdlError::usage("Raw XML is not well-formed: " + result.error.message);
        return result;
    }

    const QByteArray bytes = xml.toUtf8();
    return run(QStringLiteral("raw XML"), [&](int) {
        return exchange(bytes, QStringLiteral("raw XML"));
    });
}

} // namespace edlkit
