#pragma once

#include <QByteArray>
#include <QString>

namespace edlkit {

enum class EdlErrorKind {
    None = 0,
    TransportError,      // channel closed, stalled or faulted; fatal to the session
    ProtocolViolation,   // unexpected command, malformed packet/XML; fatal to the session
    DeviceRejected,      // NAK (or exhausted retries); fatal to the operation only
    Timeout,             // no response within bound; retried by RetryPolicy
    UnsupportedFeature,  // rejected before any transport I/O
    UsageError,          // caller sequencing or argument mistake
    Cancelled,           // stopped by the caller's abort signal
};

struct EdlError {
    EdlErrorKind kind = EdlErrorKind::None;
    QString message;
    QByteArray rawData;   // offending bytes, when there are any

    bool isError() const { return kind != EdlErrorKind::None; }
    bool isSessionFatal() const {
        return kind == EdlErrorKind::TransportError ||
               kind == EdlErrorKind::ProtocolViolation;
    }

    QString toString() const;

    static EdlError transport(const QString& message);
    static EdlError protocol(const QString& message, const QByteArray& raw = QByteArray());
    static EdlError rejected(const QString& message, const QByteArray& raw = QByteArray());
    static EdlError timeout(const QString& message);
    static EdlError unsupported(const QString& message);
    static EdlError usage(const QString& message);
    static EdlError cancelled(const QString& message);

    static QString kindName(EdlErrorKind kind);
};

} // namespace edlkit
