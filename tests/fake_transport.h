#pragma once

#include "transport/i_transport.h"

#include <QByteArray>
#include <QList>
#include <functional>

namespace edlkit {
namespace test {

// In-memory duplex channel. Bytes queued with pushIncoming() are handed to the
// host in reads of at most maxReadChunk bytes; every host write is recorded and
// passed to the responder, which plays the device.
class FakeTransport : public ITransport {
public:
    using Responder = std::function<void(const QByteArray& written)>;

    FakeTransport();

    void setResponder(Responder responder) { m_responder = std::move(responder); }
    void pushIncoming(const QByteArray& bytes) { m_incoming.append(bytes); }
    void setMaxReadChunk(int bytes) { m_maxReadChunk = bytes; }

    // The next n reads time out even when data is queued.
    void injectReadTimeouts(int n) { m_pendingTimeouts = n; }
    // Writes after the first n fail with IoError; -1 disables.
    void failWritesAfter(int n) { m_writesBeforeFailure = n; }
    // Peer disconnect: reads report Closed once the queue is drained.
    void disconnectPeer() { m_peerGone = true; }

    const QList<QByteArray>& writes() const { return m_writes; }
    QByteArray allWritten() const;
    int pendingIncoming() const { return static_cast<int>(m_incoming.size()); }
    int readCalls() const { return m_readCalls; }

    // ITransport
    bool open() override;
    void close() override;
    bool isOpen() const override { return m_open; }
    QByteArray read(int maxSize, int timeoutMs) override;
    qint64 write(const QByteArray& data, int timeoutMs) override;
    TransportStatus status() const override { return m_status; }
    TransportType type() const override { return TransportType::Virtual; }
    QString description() const override { return QStringLiteral("fake"); }

private:
    QByteArray m_incoming;
    QList<QByteArray> m_writes;
    Responder m_responder;
    TransportStatus m_status = TransportStatus::Ok;
    int m_maxReadChunk = 1 << 20;
    int m_pendingTimeouts = 0;
    int m_writesBeforeFailure = -1;
    int m_readCalls = 0;
    bool m_open = true;
    bool m_peerGone = false;
};

} // namespace test
} // namespace edlkit
