#include "retry_policy.h"

namespace edlkit {

RetryPolicy::RetryPolicy()
    : m_fatalNakPatterns(defaultFatalNakPatterns())
{
}

RetryPolicy::RetryPolicy(int maxRetries, const QStringList& fatalNakPatterns)
    : m_maxRetries(maxRetries < 0 ? 0 : maxRetries)
    , m_fatalNakPatterns(fatalNakPatterns)
{
}

QStringList RetryPolicy::defaultFatalNakPatterns()
{
    return {
        QStringLiteral("unsupported"),
        QStringLiteral("not supported"),
        QStringLiteral("unknown command"),
        QStringLiteral("unrecognized"),
        QStringLiteral("invalid"),
        QStringLiteral("not allowed"),
        QStringLiteral("authentication"),
    };
}

bool RetryPolicy::isRetryableNak(const QString& reason) const
{
    for (const QString& pattern : m_fatalNakPatterns) {
        if (!pattern.isEmpty() && reason.contains(pattern, Qt::CaseInsensitive))
            return false;
    }
    return true;
}

bool RetryPolicy::isRetryable(const EdlError& error) const
{
    switch (error.kind) {
    case EdlErrorKind::Timeout:
        return true;
    case EdlErrorKind::DeviceRejected:
        return isRetryableNak(error.message);
    default:
        return false;
    }
}

} // namespace edlkit
