#pragma once

#include "common/edl_error.h"
#include "common/retry_policy.h"
#include "core/logger.h"
#include "qualcomm/protocol/session_context.h"

#include <QString>
#include <QStringList>

namespace edlkit {

// Runtime settings for one session. Plain value; nothing here is process-wide.
struct EdlConfig {
    // [retry]
    int maxRetries = RetryPolicy::DEFAULT_MAX_RETRIES;
    QStringList fatalNakPatterns = RetryPolicy::defaultFatalNakPatterns();

    // [timeouts]
    int helloTimeoutMs = 60000;
    int packetTimeoutMs = 30000;
    int xmlTimeoutMs = 10000;
    int dataTimeoutMs = 60000;

    // [firehose]
    QString memoryName = QStringLiteral("ufs");
    qint64 maxPayloadToTarget = 1048576;
    qint64 maxPayloadFromTarget = 1048576;
    uint32_t sectorSize = 0;
    bool skipStorageInit = false;

    // [log]
    LogLevel logLevel = LogLevel::Info;
    QString logDir;

    SessionParams sessionParams() const;
    RetryPolicy retryPolicy() const;

    // Applies log level and log directory to the Logger singleton.
    void applyLogging() const;

    // Missing keys keep their defaults; unusable values fall back with a warning.
    // A missing file is a UsageError.
    static bool load(const QString& path, EdlConfig& config, EdlError& error);
    bool save(const QString& path, EdlError& error) const;
};

} // namespace edlkit
