#include "firehose_xml.h"

#include <QXmlStreamReader>
#include <QXmlStreamWriter>
#include <QtEndian>

#include <algorithm>

namespace edlkit {

// ─── Attribute schema ────────────────────────────────────────────────

namespace {

enum class AttrType { Int, Hex, String };

struct AttrSpec {
    const char* name;
    AttrType type;
    bool required;
};

struct VerbSpec {
    FirehoseVerb verb;
    const char* name;
    QList<AttrSpec> attrs;
};

const QList<VerbSpec>& verbTable()
{
    static const QList<AttrSpec> sectorRange = {
        { "SECTOR_SIZE_IN_BYTES",      AttrType::Int,    true  },
        { "num_partition_sectors",     AttrType::Int,    true  },
        { "physical_partition_number", AttrType::Int,    true  },
        { "start_sector",              AttrType::Int,    true  },
        { "filename",                  AttrType::String, false },
        { "label",                     AttrType::String, false },
    };

    static const QList<VerbSpec> table = {
        { FirehoseVerb::Configure, "configure", {
            { "MemoryName",                      AttrType::String, true  },
            { "MaxPayloadSizeToTargetInBytes",   AttrType::Int,    true  },
            { "MaxPayloadSizeFromTargetInBytes", AttrType::Int,    false },
            { "verbose",                         AttrType::Int,    false },
            { "ZlpAwareHost",                    AttrType::Int,    false },
            { "SkipStorageInit",                 AttrType::Int,    false },
        } },
        { FirehoseVerb::Program, "program", sectorRange },
        { FirehoseVerb::Read,    "read",    sectorRange },
        { FirehoseVerb::Erase,   "erase", {
            { "SECTOR_SIZE_IN_BYTES",      AttrType::Int,    true  },
            { "num_partition_sectors",     AttrType::Int,    true  },
            { "physical_partition_number", AttrType::Int,    true  },
            { "start_sector",              AttrType::Int,    true  },
            { "label",                     AttrType::String, false },
        } },
        { FirehoseVerb::Peek, "peek", {
            { "address64",   AttrType::Hex, true },
            { "SizeInBytes", AttrType::Int, true },
        } },
        { FirehoseVerb::Poke, "poke", {
            { "address64",   AttrType::Hex, true },
            { "SizeInBytes", AttrType::Int, true },
            { "value64",     AttrType::Hex, true },
        } },
        { FirehoseVerb::Patch, "patch", {
            { "SECTOR_SIZE_IN_BYTES",      AttrType::Int,    true },
            { "byte_offset",               AttrType::Int,    true },
            { "filename",                  AttrType::String, true },
            { "physical_partition_number", AttrType::Int,    true },
            { "size_in_bytes",             AttrType::Int,    true },
            { "start_sector",              AttrType::Int,    true },
            { "value",                     AttrType::String, true },
        } },
        { FirehoseVerb::Power, "power", {
            { "value",          AttrType::String, true  },
            { "DelayInSeconds", AttrType::Int,    false },
        } },
        { FirehoseVerb::GetStorageInfo, "getstorageinfo", {
            { "physical_partition_number", AttrType::Int, true },
        } },
        { FirehoseVerb::SetBootableStorageDrive, "setbootablestoragedrive", {
            { "value", AttrType::Int, true },
        } },
        { FirehoseVerb::SetActiveSlot, "setactiveslot", {
            { "slot", AttrType::String, true },
        } },
        { FirehoseVerb::Nop, "nop", {} },
    };
    return table;
}

const VerbSpec& specFor(FirehoseVerb verb)
{
    for (const VerbSpec& spec : verbTable()) {
        if (spec.verb == verb)
            return spec;
    }
    return verbTable().last();
}

bool parseUnsigned(const QString& text, int base, uint64_t& out)
{
    bool ok = false;
    out = text.toULongLong(&ok, base);
    return ok;
}

// Formats a value for the wire, or returns false when it does not fit the type.
bool formatValue(const QVariant& value, AttrType type, QString& out)
{
    const QString text = value.toString().trimmed();
    uint64_t n = 0;

    switch (type) {
    case AttrType::String:
        out = text;
        return !text.isEmpty();

    case AttrType::Int:
        if (!parseUnsigned(text, 10, n))
            return false;
        out = QString::number(n);
        return true;

    case AttrType::Hex:
        if (text.startsWith(QLatin1String("0x"), Qt::CaseInsensitive)) {
            if (!parseUnsigned(text.mid(2), 16, n))
                return false;
        } else if (!parseUnsigned(text, 10, n)) {
            return false;
        }
        out = QString("0x%1").arg(n, 0, 16);
        return true;
    }
    return false;
}

void setError(EdlError* error, const QString& message)
{
    if (error)
        *error = EdlError::usage(message);
}

} // namespace

// ─── FirehoseCommand ─────────────────────────────────────────────────

QString FirehoseCommand::verbName(FirehoseVerb verb)
{
    return QString::fromLatin1(specFor(verb).name);
}

bool FirehoseCommand::verbFromName(const QString& name, FirehoseVerb* verb)
{
    for (const VerbSpec& spec : verbTable()) {
        if (name.compare(QLatin1String(spec.name), Qt::CaseInsensitive) == 0) {
            if (verb)
                *verb = spec.verb;
            return true;
        }
    }
    return false;
}

FirehoseCommand FirehoseCommand::create(FirehoseVerb verb, const QVariantMap& attributes,
                                        EdlError* error)
{
    const VerbSpec& spec = specFor(verb);
    FirehoseCommand cmd;
    cmd.m_verb = verb;

    for (auto it = attributes.constBegin(); it != attributes.constEnd(); ++it) {
        bool known = false;
        for (const AttrSpec& attr : spec.attrs)
            known = known || it.key() == QLatin1String(attr.name);
        if (!known) {
            setError(error, QString("<%1> has no attribute '%2'").arg(QLatin1String(spec.name), it.key()));
            return FirehoseCommand();
        }
    }

    for (const AttrSpec& attr : spec.attrs) {
        const QString key = QString::fromLatin1(attr.name);
        if (!attributes.contains(key)) {
            if (attr.required) {
                setError(error, QString("<%1> requires attribute '%2'").arg(QLatin1String(spec.name), key));
                return FirehoseCommand();
            }
            continue;
        }
        QString formatted;
        if (!formatValue(attributes.value(key), attr.type, formatted)) {
            setError(error, QString("<%1> attribute '%2' has invalid value '%3'")
                                .arg(QLatin1String(spec.name), key, attributes.value(key).toString()));
            return FirehoseCommand();
        }
        cmd.m_attributes.append({ key, formatted });
    }

    cmd.m_valid = true;
    return cmd;
}

FirehoseCommand FirehoseCommand::configure(const QString& memoryName, qint64 maxPayloadToTarget,
                                           bool skipStorageInit)
{
    return create(FirehoseVerb::Configure, {
        { "MemoryName", memoryName },
        { "MaxPayloadSizeToTargetInBytes", maxPayloadToTarget },
        { "verbose", 0 },
        { "ZlpAwareHost", 1 },
        { "SkipStorageInit", skipStorageInit ? 1 : 0 },
    });
}

static QVariantMap sectorRange(uint32_t sectorSize, uint64_t startSector, uint64_t numSectors,
                               uint32_t lun)
{
    return {
        { "SECTOR_SIZE_IN_BYTES", sectorSize },
        { "num_partition_sectors", static_cast<qulonglong>(numSectors) },
        { "physical_partition_number", lun },
        { "start_sector", static_cast<qulonglong>(startSector) },
    };
}

FirehoseCommand FirehoseCommand::program(uint32_t sectorSize, uint64_t startSector,
                                         uint64_t numSectors, uint32_t lun, const QString& label)
{
    QVariantMap attrs = sectorRange(sectorSize, startSector, numSectors, lun);
    if (!label.isEmpty()) {
        attrs.insert("label", label);
        attrs.insert("filename", label);
    }
    return create(FirehoseVerb::Program, attrs);
}

FirehoseCommand FirehoseCommand::read(uint32_t sectorSize, uint64_t startSector,
                                      uint64_t numSectors, uint32_t lun, const QString& label)
{
    QVariantMap attrs = sectorRange(sectorSize, startSector, numSectors, lun);
    if (!label.isEmpty()) {
        attrs.insert("label", label);
        attrs.insert("filename", label);
    }
    return create(FirehoseVerb::Read, attrs);
}

FirehoseCommand FirehoseCommand::erase(uint32_t sectorSize, uint64_t startSector,
                                       uint64_t numSectors, uint32_t lun)
{
    return create(FirehoseVerb::Erase, sectorRange(sectorSize, startSector, numSectors, lun));
}

FirehoseCommand FirehoseCommand::peek(uint64_t address, uint32_t size)
{
    return create(FirehoseVerb::Peek, {
        { "address64", static_cast<qulonglong>(address) },
        { "SizeInBytes", size },
    });
}

FirehoseCommand FirehoseCommand::poke(uint64_t address, const QByteArray& bytes)
{
    if (bytes.isEmpty() || bytes.size() > MAX_POKE_BYTES)
        return FirehoseCommand();

    // value64 carries the bytes as a little-endian integer
    uchar raw[8] = {};
    std::copy(bytes.constBegin(), bytes.constEnd(), reinterpret_cast<char*>(raw));
    const quint64 value = qFromLittleEndian<quint64>(raw);

    return create(FirehoseVerb::Poke, {
        { "address64", static_cast<qulonglong>(address) },
        { "SizeInBytes", static_cast<int>(bytes.size()) },
        { "value64", static_cast<qulonglong>(value) },
    });
}

FirehoseCommand FirehoseCommand::patch(uint32_t sectorSize, uint64_t startSector,
                                       uint32_t byteOffset, uint32_t size,
                                       const QString& value, uint32_t lun)
{
    return create(FirehoseVerb::Patch, {
        { "SECTOR_SIZE_IN_BYTES", sectorSize },
        { "byte_offset", byteOffset },
        { "filename", QStringLiteral("DISK") },
        { "physical_partition_number", lun },
        { "size_in_bytes", size },
        { "start_sector", static_cast<qulonglong>(startSector) },
        { "value", value },
    });
}

FirehoseCommand FirehoseCommand::power(const QString& mode, int delaySeconds)
{
    QVariantMap attrs = { { "value", mode } };
    if (delaySeconds >= 0)
        attrs.insert("DelayInSeconds", delaySeconds);
    return create(FirehoseVerb::Power, attrs);
}

FirehoseCommand FirehoseCommand::getStorageInfo(uint32_t lun)
{
    return create(FirehoseVerb::GetStorageInfo, { { "physical_partition_number", lun } });
}

FirehoseCommand FirehoseCommand::setBootableStorageDrive(uint32_t lun)
{
    return create(FirehoseVerb::SetBootableStorageDrive, { { "value", lun } });
}

FirehoseCommand FirehoseCommand::setActiveSlot(const QString& slot)
{
    return create(FirehoseVerb::SetActiveSlot, { { "slot", slot } });
}

FirehoseCommand FirehoseCommand::nop()
{
    return create(FirehoseVerb::Nop, {});
}

QString FirehoseCommand::attribute(const QString& name) const
{
    for (const Attribute& attr : m_attributes) {
        if (attr.first == name)
            return attr.second;
    }
    return QString();
}

uint64_t FirehoseCommand::intAttribute(const QString& name, uint64_t fallback) const
{
    const QString text = attribute(name);
    uint64_t value = 0;
    const bool ok = text.startsWith(QLatin1String("0x"))
                        ? parseUnsigned(text.mid(2), 16, value)
                        : parseUnsigned(text, 10, value);
    return ok ? value : fallback;
}

QByteArray FirehoseCommand::toXml() const
{
    QString xml;
    QXmlStreamWriter w(&xml);
    w.writeStartDocument();
    w.writeStartElement("data");
    w.writeStartElement(name());
    for (const Attribute& attr : m_attributes)
        w.writeAttribute(attr.first, attr.second);
    w.writeEndElement();
    w.writeEndElement();
    w.writeEndDocument();
    return xml.toUtf8();
}

bool FirehoseCommand::operator==(const FirehoseCommand& other) const
{
    return m_valid == other.m_valid && m_verb == other.m_verb &&
           m_attributes == other.m_attributes;
}

// ─── FirehoseResponse ────────────────────────────────────────────────

bool FirehoseResponse::rawMode() const
{
    return attributes.value(QStringLiteral("rawmode")).compare(QLatin1String("true"),
                                                               Qt::CaseInsensitive) == 0;
}

// ─── FirehoseResponseParser ──────────────────────────────────────────

static bool isFiller(char c)
{
    return c == '\0' || c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Finds the first balanced top-level fragment: optional declarations and comments
// followed by one element and everything up to its matching close tag.
FirehoseResponseParser::Scan FirehoseResponseParser::scanFragment(int& begin, int& end) const
{
    const QByteArray& b = m_buffer;
    const int n = b.size();
    int pos = 0;
    int depth = 0;
    begin = -1;
    end = -1;

    while (true) {
        if (depth == 0) {
            while (pos < n && isFiller(b[pos]))
                ++pos;
            if (pos < n && begin < 0)
                begin = pos;
        }
        if (pos >= n)
            return Scan::Incomplete;

        if (b[pos] != '<') {
            if (depth == 0)
                return Scan::Malformed;
            pos = b.indexOf('<', pos);
            if (pos < 0)
                return Scan::Incomplete;
            continue;
        }

        if (b.mid(pos, 2) == "<?") {
            const int close = b.indexOf("?>", pos + 2);
            if (close < 0)
                return Scan::Incomplete;
            pos = close + 2;
            continue;
        }
        if (b.mid(pos, 4) == "<!--") {
            const int close = b.indexOf("-->", pos + 4);
            if (close < 0)
                return Scan::Incomplete;
            pos = close + 3;
            continue;
        }
        if (b.mid(pos, 2) == "<!")
            return pos + 2 < n ? Scan::Malformed : Scan::Incomplete;

        // Element tag: find '>' outside quoted attribute values
        char quote = 0;
        int q = pos + 1;
        for (; q < n; ++q) {
            const char c = b[q];
            if (quote) {
                if (c == quote)
                    quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                break;
            } else if (c == '<') {
                return Scan::Malformed;
            }
        }
        if (q >= n)
            return Scan::Incomplete;

        const bool closing = b[pos + 1] == '/';
        const bool selfClosing = b[q - 1] == '/';
        if (closing) {
            if (depth == 0)
                return Scan::Malformed;
            --depth;
        } else if (!selfClosing) {
            ++depth;
        }
        pos = q + 1;

        if (depth == 0) {
            end = pos;
            return Scan::Complete;
        }
    }
}

FirehoseParseStatus FirehoseResponseParser::next(FirehoseElement& element, EdlError& error)
{
    while (m_queue.isEmpty()) {
        int begin = 0;
        int end = 0;
        const Scan scan = scanFragment(begin, end);

        if (scan == Scan::Incomplete) {
            if (begin < 0) {
                m_buffer.clear();   // only padding so far
            } else if (m_buffer.size() > MAX_PENDING_BYTES) {
                error = EdlError::protocol(
                    QString("Unterminated XML after %1 bytes").arg(m_buffer.size()),
                    m_buffer.left(256));
                m_buffer.clear();
                return FirehoseParseStatus::Malformed;
            }
            return FirehoseParseStatus::NeedMore;
        }
        if (scan == Scan::Malformed) {
            error = EdlError::protocol("Malformed XML from device", m_buffer.left(256));
            m_buffer.clear();
            return FirehoseParseStatus::Malformed;
        }

        const QByteArray fragment = m_buffer.mid(begin, end - begin);
        m_buffer.remove(0, end);

        QList<FirehoseElement> elements;
        if (!parseFragment(fragment, elements, error))
            return FirehoseParseStatus::Malformed;
        for (const FirehoseElement& e : elements)
            m_queue.enqueue(e);
    }

    element = m_queue.dequeue();
    return FirehoseParseStatus::Element;
}

bool FirehoseResponseParser::parseFragment(const QByteArray& fragment,
                                           QList<FirehoseElement>& out, EdlError& error)
{
    QXmlStreamReader reader(fragment);
    while (!reader.atEnd()) {
        reader.readNext();
        if (!reader.isStartElement() || reader.name() == QLatin1String("data"))
            continue;

        FirehoseElement element;
        element.name = reader.name().toString();
        for (const QXmlStreamAttribute& attr : reader.attributes())
            element.attributes.insert(attr.name().toString(), attr.value().toString());
        out.append(element);
    }

    if (reader.hasError()) {
        error = EdlError::protocol(QString("Malformed XML from device: %1")
                                       .arg(reader.errorString()), fragment);
        return false;
    }
    return true;
}

QByteArray FirehoseResponseParser::takeRemainder()
{
    QByteArray rest = m_buffer;
    m_buffer.clear();
    return rest;
}

void FirehoseResponseParser::reset()
{
    m_buffer.clear();
    m_queue.clear();
}

} // namespace edlkit
