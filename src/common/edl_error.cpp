#include "edl_error.h"

namespace edlkit {

namespace {

EdlError make(EdlErrorKind kind, const QString& message, const QByteArray& raw = QByteArray())
{
    EdlError e;
    e.kind = kind;
    e.message = message;
    e.rawData = raw;
    return e;
}

} // namespace

EdlError EdlError::transport(const QString& message)
{
    return make(EdlErrorKind::TransportError, message);
}

EdlError EdlError::protocol(const QString& message, const QByteArray& raw)
{
    return make(EdlErrorKind::ProtocolViolation, message, raw);
}

EdlError EdlError::rejected(const QString& message, const QByteArray& raw)
{
    return make(EdlErrorKind::DeviceRejected, message, raw);
}

EdlError EdlError::timeout(const QString& message)
{
    return make(EdlErrorKind::Timeout, message);
}

EdlError EdlError::unsupported(const QString& message)
{
    return make(EdlErrorKind::UnsupportedFeature, message);
}

EdlError EdlError::usage(const QString& message)
{
    return make(EdlErrorKind::UsageError, message);
}

EdlError EdlError::cancelled(const QString& message)
{
    return make(EdlErrorKind::Cancelled, message);
}

QString EdlError::kindName(EdlErrorKind kind)
{
    switch (kind) {
    case EdlErrorKind::None:               return QStringLiteral("None");
    case EdlErrorKind::TransportError:     return QStringLiteral("TransportError");
    case EdlErrorKind::ProtocolViolation:  return QStringLiteral("ProtocolViolation");
    case EdlErrorKind::DeviceRejected:     return QStringLiteral("DeviceRejected");
    case EdlErrorKind::Timeout:            return QStringLiteral("Timeout");
    case EdlErrorKind::UnsupportedFeature: return QStringLiteral("UnsupportedFeature");
    case EdlErrorKind::UsageError:         return QStringLiteral("UsageError");
    case EdlErrorKind::Cancelled:          return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

QString EdlError::toString() const
{
    if (!isError())
        return QStringLiteral("OK");

    QString text = QString("%1: %2").arg(kindName(kind), message);
    if (!rawData.isEmpty()) {
        // Enough of the offending bytes to identify a packet or XML fragment
        text += QString(" [raw %1 bytes: %2]")
                    .arg(rawData.size())
                    .arg(QString(rawData.left(64).toHex(' ')));
    }
    return text;
}

} // namespace edlkit
