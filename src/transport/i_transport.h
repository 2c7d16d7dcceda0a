#pragma once

#include <QByteArray>
#include <QString>
#include <cstdint>

namespace edlkit {

enum class TransportType {
    None = 0,
    Serial,
    USB,
    Virtual
};

enum class TransportStatus {
    Ok = 0,
    Timeout,    // last read/write saw no progress within its timeout
    Closed,     // not open, or the peer went away
    IoError
};

// Bulk-style duplex byte channel. Message boundaries are not preserved: a read may
// return part of a packet or several packets at once.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Returns up to maxSize bytes; empty on timeout or error (see status()).
    virtual QByteArray read(int maxSize, int timeoutMs) = 0;
    // Returns bytes written, or -1 on error (see status()).
    virtual qint64 write(const QByteArray& data, int timeoutMs) = 0;

    // Outcome of the most recent read/write call.
    virtual TransportStatus status() const = 0;

    virtual TransportType type() const = 0;
    virtual QString description() const = 0;
};

inline QString transportStatusName(TransportStatus status)
{
    switch (status) {
    case TransportStatus::Ok:      return QStringLiteral("ok");
    case TransportStatus::Timeout: return QStringLiteral("timeout");
    case TransportStatus::Closed:  return QStringLiteral("closed");
    case TransportStatus::IoError: return QStringLiteral("I/O error");
    }
    return QStringLiteral("unknown");
}

} // namespace edlkit
