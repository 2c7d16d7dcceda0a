#pragma once

#include <QAtomicInt>

namespace edlkit {

// Caller-owned abort signal. Engines only poll it between chunks.
class CancellationToken {
public:
    void cancel() { m_cancelled.storeRelease(1); }
    void clear() { m_cancelled.storeRelease(0); }
    bool isCancelled() const { return m_cancelled.loadAcquire() != 0; }

private:
    QAtomicInt m_cancelled{0};
};

} // namespace edlkit
