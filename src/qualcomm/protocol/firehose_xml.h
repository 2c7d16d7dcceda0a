#pragma once

#include "common/edl_error.h"

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QPair>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <cstdint>

namespace edlkit {

enum class FirehoseVerb {
    Configure,
    Program,
    Read,
    Erase,
    Peek,
    Poke,
    Patch,
    Power,
    GetStorageInfo,
    SetBootableStorageDrive,
    SetActiveSlot,
    Nop,
};

// ─── Firehose command ────────────────────────────────────────────────
// One command element. Each verb has a fixed attribute schema; create() refuses
// unknown or missing attributes and values of the wrong type, so an invalid
// command never reaches the device.
class FirehoseCommand {
public:
    using Attribute = QPair<QString, QString>;

    FirehoseCommand() = default;   // invalid

    static FirehoseCommand create(FirehoseVerb verb, const QVariantMap& attributes,
                                  EdlError* error = nullptr);

    static FirehoseCommand configure(const QString& memoryName, qint64 maxPayloadToTarget,
                                     bool skipStorageInit);
    static FirehoseCommand program(uint32_t sectorSize, uint64_t startSector,
                                   uint64_t numSectors, uint32_t lun,
                                   const QString& label = QString());
    static FirehoseCommand read(uint32_t sectorSize, uint64_t startSector,
                                uint64_t numSectors, uint32_t lun,
                                const QString& label = QString());
    static FirehoseCommand erase(uint32_t sectorSize, uint64_t startSector,
                                 uint64_t numSectors, uint32_t lun);
    static FirehoseCommand peek(uint64_t address, uint32_t size);
    static FirehoseCommand poke(uint64_t address, const QByteArray& bytes);
    static FirehoseCommand patch(uint32_t sectorSize, uint64_t startSector, uint32_t byteOffset,
                                 uint32_t size, const QString& value, uint32_t lun);
    static FirehoseCommand power(const QString& mode, int delaySeconds = -1);
    static FirehoseCommand getStorageInfo(uint32_t lun);
    static FirehoseCommand setBootableStorageDrive(uint32_t lun);
    static FirehoseCommand setActiveSlot(const QString& slot);
    static FirehoseCommand nop();

    bool isValid() const { return m_valid; }
    FirehoseVerb verb() const { return m_verb; }
    QString name() const { return verbName(m_verb); }

    // Attributes in schema order, already formatted for the wire.
    const QList<Attribute>& attributes() const { return m_attributes; }
    QString attribute(const QString& name) const;
    uint64_t intAttribute(const QString& name, uint64_t fallback = 0) const;

    // <?xml ...?><data><verb .../></data>
    QByteArray toXml() const;

    bool operator==(const FirehoseCommand& other) const;
    bool operator!=(const FirehoseCommand& other) const { return !(*this == other); }

    static QString verbName(FirehoseVerb verb);
    static bool verbFromName(const QString& name, FirehoseVerb* verb);

    // Largest poke payload one command carries (value64).
    static constexpr int MAX_POKE_BYTES = 8;

private:
    FirehoseVerb m_verb = FirehoseVerb::Nop;
    QList<Attribute> m_attributes;
    bool m_valid = false;
};

// ─── Firehose response ───────────────────────────────────────────────

enum class FirehoseOutcome { Ack, Nak };

struct FirehoseResponse {
    FirehoseOutcome outcome = FirehoseOutcome::Nak;
    QString reason;                     // NAK diagnostic, when the device gave one
    QStringList logLines;               // <log value=.../> lines in arrival order
    QMap<QString, QString> attributes;  // attributes of the <response> element

    bool isAck() const { return outcome == FirehoseOutcome::Ack; }
    bool rawMode() const;
    QString attribute(const QString& name) const { return attributes.value(name); }
};

struct FirehoseElement {
    QString name;
    QMap<QString, QString> attributes;
};

enum class FirehoseParseStatus { NeedMore, Element, Malformed };

// Incremental parser for the device's XML stream. Bytes are fed as they arrive;
// next() hands out <response>/<log> elements once a balanced fragment is buffered.
// Bytes after the fragment holding a response stay untouched for the data phase.
class FirehoseResponseParser {
public:
    static constexpr int MAX_PENDING_BYTES = 1024 * 1024;

    void feed(const QByteArray& bytes) { m_buffer.append(bytes); }
    FirehoseParseStatus next(FirehoseElement& element, EdlError& error);

    // Unscanned bytes (raw data following an ACK); clears the buffer.
    QByteArray takeRemainder();
    void reset();

    int pendingBytes() const { return m_buffer.size(); }
    bool hasQueuedElements() const { return !m_queue.isEmpty(); }

    // Parses one complete document or element into its non-<data> elements.
    static bool parseFragment(const QByteArray& fragment, QList<FirehoseElement>& out,
                              EdlError& error);

private:
    enum class Scan { Incomplete, Complete, Malformed };
    Scan scanFragment(int& begin, int& end) const;

    QByteArray m_buffer;
    QQueue<FirehoseElement> m_queue;
};

} // namespace edlkit
