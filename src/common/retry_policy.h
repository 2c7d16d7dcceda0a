#pragma once

#include "edl_error.h"
#include "core/logger.h"

#include <QString>
#include <QStringList>
#include <functional>

namespace edlkit {

// Bounded-retry policy shared by the protocol engines. Only Timeouts and NAKs whose
// reason is not on the fatal list are retried; everything else is returned as-is.
class RetryPolicy {
public:
    static constexpr int DEFAULT_MAX_RETRIES = 3;

    RetryPolicy();
    explicit RetryPolicy(int maxRetries,
                         const QStringList& fatalNakPatterns = defaultFatalNakPatterns());

    int maxRetries() const { return m_maxRetries; }
    const QStringList& fatalNakPatterns() const { return m_fatalNakPatterns; }

    bool isRetryable(const EdlError& error) const;
    bool isRetryableNak(const QString& reason) const;

    static QStringList defaultFatalNakPatterns();

    // Calls attempt(n) for n = 0..maxRetries until it succeeds or fails with a
    // non-retryable error. Result needs `success`, `error` and `attempts` members.
    // An exhausted Timeout is escalated to DeviceRejected.
    template <typename Result>
    Result run(const QString& what, const std::function<Result(int attempt)>& attempt) const
    {
        Result result;
        for (int n = 0; n <= m_maxRetries; ++n) {
            if (n > 0) {
                LOG_WARNING_CAT(QStringLiteral("Retry"),
                                QString("%1: retry %2/%3 after %4")
                                    .arg(what).arg(n).arg(m_maxRetries)
                                    .arg(result.error.toString()));
            }
            result = attempt(n);
            result.attempts = n + 1;
            if (result.success || !isRetryable(result.error))
                return result;
        }

        if (result.error.kind == EdlErrorKind::Timeout) {
            result.error = EdlError::rejected(
                QString("%1: no response after %2 attempts (%3)")
                    .arg(what).arg(m_maxRetries + 1).arg(result.error.message));
        }
        LOG_ERROR_CAT(QStringLiteral("Retry"),
                      QString("%1: giving up: %2").arg(what, result.error.toString()));
        return result;
    }

private:
    int m_maxRetries = DEFAULT_MAX_RETRIES;
    QStringList m_fatalNakPatterns;
};

} // namespace edlkit
