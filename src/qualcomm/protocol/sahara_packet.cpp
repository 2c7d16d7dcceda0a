#include "sahara_packet.h"

#include <QtEndian>
#include <QVector>

namespace edlkit {

namespace {

enum class Field {
    Version, VersionMin, MaxCommandLength, Mode, Status,
    Reserved0, Reserved1, Reserved2, Reserved3, Reserved4, Reserved5,
    ImageId, Offset, Size, ClientCommand, DataLength,
};

struct FieldSpec {
    Field field;
    int width;   // 4 or 8 bytes
};

using Schema = QVector<FieldSpec>;

const Schema* schemaFor(uint32_t commandId)
{
    static const Schema empty;
    static const Schema hello = {
        {Field::Version, 4}, {Field::VersionMin, 4}, {Field::MaxCommandLength, 4}, {Field::Mode, 4},
        {Field::Reserved0, 4}, {Field::Reserved1, 4}, {Field::Reserved2, 4},
        {Field::Reserved3, 4}, {Field::Reserved4, 4}, {Field::Reserved5, 4},
    };
    static const Schema helloResponse = {
        {Field::Version, 4}, {Field::VersionMin, 4}, {Field::Status, 4}, {Field::Mode, 4},
        {Field::Reserved0, 4}, {Field::Reserved1, 4}, {Field::Reserved2, 4},
        {Field::Reserved3, 4}, {Field::Reserved4, 4}, {Field::Reserved5, 4},
    };
    static const Schema readData = {{Field::ImageId, 4}, {Field::Offset, 4}, {Field::Size, 4}};
    static const Schema endImage = {{Field::ImageId, 4}, {Field::Status, 4}};
    static const Schema doneResponse = {{Field::Status, 4}};
    static const Schema memory32 = {{Field::Offset, 4}, {Field::Size, 4}};
    static const Schema memory64 = {{Field::Offset, 8}, {Field::Size, 8}};
    static const Schema switchMode = {{Field::Mode, 4}};
    static const Schema execute = {{Field::ClientCommand, 4}};
    static const Schema executeData = {{Field::ClientCommand, 4}, {Field::DataLength, 4}};
    static const Schema readData64 = {{Field::ImageId, 8}, {Field::Offset, 8}, {Field::Size, 8}};

    switch (static_cast<SaharaCommand>(commandId)) {
    case SaharaCommand::Hello:             return &hello;
    case SaharaCommand::HelloResponse:     return &helloResponse;
    case SaharaCommand::ReadData:          return &readData;
    case SaharaCommand::EndImageTransfer:  return &endImage;
    case SaharaCommand::Done:              return &empty;
    case SaharaCommand::DoneResponse:      return &doneResponse;
    case SaharaCommand::Reset:             return &empty;
    case SaharaCommand::ResetResponse:     return &empty;
    case SaharaCommand::MemoryDebug:       return &memory32;
    case SaharaCommand::MemoryRead:        return &memory32;
    case SaharaCommand::CommandReady:      return &empty;
    case SaharaCommand::SwitchMode:        return &switchMode;
    case SaharaCommand::Execute:           return &execute;
    case SaharaCommand::ExecuteData:       return &executeData;
    case SaharaCommand::ExecuteResponse:   return &execute;
    case SaharaCommand::MemoryDebug64:     return &memory64;
    case SaharaCommand::MemoryRead64:      return &memory64;
    case SaharaCommand::ReadData64:        return &readData64;
    case SaharaCommand::ResetStateMachine: return &empty;
    }
    return nullptr;
}

uint64_t getField(const SaharaPacket& p, Field f)
{
    switch (f) {
    case Field::Version:          return p.version;
    case Field::VersionMin:       return p.versionMin;
    case Field::MaxCommandLength: return p.maxCommandLength;
    case Field::Mode:             return p.mode;
    case Field::Status:           return p.status;
    case Field::Reserved0:        return p.reserved[0];
    case Field::Reserved1:        return p.reserved[1];
    case Field::Reserved2:        return p.reserved[2];
    case Field::Reserved3:        return p.reserved[3];
    case Field::Reserved4:        return p.reserved[4];
    case Field::Reserved5:        return p.reserved[5];
    case Field::ImageId:          return p.imageId;
    case Field::Offset:           return p.offset;
    case Field::Size:             return p.size;
    case Field::ClientCommand:    return p.clientCommand;
    case Field::DataLength:       return p.dataLength;
    }
    return 0;
}

void setField(SaharaPacket& p, Field f, uint64_t v)
{
    const auto v32 = static_cast<uint32_t>(v);
    switch (f) {
    case Field::Version:          p.version = v32; break;
    case Field::VersionMin:       p.versionMin = v32; break;
    case Field::MaxCommandLength: p.maxCommandLength = v32; break;
    case Field::Mode:             p.mode = v32; break;
    case Field::Status:           p.status = v32; break;
    case Field::Reserved0:        p.reserved[0] = v32; break;
    case Field::Reserved1:        p.reserved[1] = v32; break;
    case Field::Reserved2:        p.reserved[2] = v32; break;
    case Field::Reserved3:        p.reserved[3] = v32; break;
    case Field::Reserved4:        p.reserved[4] = v32; break;
    case Field::Reserved5:        p.reserved[5] = v32; break;
    case Field::ImageId:          p.imageId = v; break;
    case Field::Offset:           p.offset = v; break;
    case Field::Size:             p.size = v; break;
    case Field::ClientCommand:    p.clientCommand = v32; break;
    case Field::DataLength:       p.dataLength = v32; break;
    }
}

int schemaBytes(const Schema& schema)
{
    int total = SaharaCodec::HEADER_SIZE;
    for (const FieldSpec& spec : schema)
        total += spec.width;
    return total;
}

} // namespace

bool SaharaPacket::operator==(const SaharaPacket& other) const
{
    return command == other.command && length == other.length &&
           version == other.version && versionMin == other.versionMin &&
           maxCommandLength == other.maxCommandLength && mode == other.mode &&
           status == other.status && reserved == other.reserved &&
           imageId == other.imageId && offset == other.offset && size == other.size &&
           clientCommand == other.clientCommand && dataLength == other.dataLength;
}

int SaharaCodec::packetSize(uint32_t commandId)
{
    const Schema* schema = schemaFor(commandId);
    return schema ? schemaBytes(*schema) : -1;
}

QString SaharaCodec::commandName(uint32_t commandId)
{
    switch (static_cast<SaharaCommand>(commandId)) {
    case SaharaCommand::Hello:             return QStringLiteral("Hello");
    case SaharaCommand::HelloResponse:     return QStringLiteral("HelloResponse");
    case SaharaCommand::ReadData:          return QStringLiteral("ReadData");
    case SaharaCommand::EndImageTransfer:  return QStringLiteral("EndImageTransfer");
    case SaharaCommand::Done:              return QStringLiteral("Done");
    case SaharaCommand::DoneResponse:      return QStringLiteral("DoneResponse");
    case SaharaCommand::Reset:             return QStringLiteral("Reset");
    case SaharaCommand::ResetResponse:     return QStringLiteral("ResetResponse");
    case SaharaCommand::MemoryDebug:       return QStringLiteral("MemoryDebug");
    case SaharaCommand::MemoryRead:        return QStringLiteral("MemoryRead");
    case SaharaCommand::CommandReady:      return QStringLiteral("CommandReady");
    case SaharaCommand::SwitchMode:        return QStringLiteral("SwitchMode");
    case SaharaCommand::Execute:           return QStringLiteral("Execute");
    case SaharaCommand::ExecuteData:       return QStringLiteral("ExecuteData");
    case SaharaCommand::ExecuteResponse:   return QStringLiteral("ExecuteResponse");
    case SaharaCommand::MemoryDebug64:     return QStringLiteral("MemoryDebug64");
    case SaharaCommand::MemoryRead64:      return QStringLiteral("MemoryRead64");
    case SaharaCommand::ReadData64:        return QStringLiteral("ReadData64");
    case SaharaCommand::ResetStateMachine: return QStringLiteral("ResetStateMachine");
    }
    return QString("Unknown(0x%1)").arg(commandId, 2, 16, QChar('0'));
}

QByteArray SaharaCodec::encode(const SaharaPacket& packet)
{
    const uint32_t id = static_cast<uint32_t>(packet.command);
    const Schema* schema = schemaFor(id);
    if (!schema)
        return {};

    const int total = schemaBytes(*schema);
    QByteArray out(total, '\0');
    auto* d = reinterpret_cast<uchar*>(out.data());

    qToLittleEndian<quint32>(id, d);
    qToLittleEndian<quint32>(static_cast<quint32>(total), d + 4);

    int pos = HEADER_SIZE;
    for (const FieldSpec& spec : *schema) {
        const uint64_t value = getField(packet, spec.field);
        if (spec.width == 8)
            qToLittleEndian<quint64>(value, d + pos);
        else
            qToLittleEndian<quint32>(static_cast<quint32>(value), d + pos);
        pos += spec.width;
    }
    return out;
}

SaharaDecodeResult SaharaCodec::decode(const QByteArray& data)
{
    SaharaDecodeResult result;

    if (data.size() < HEADER_SIZE) {
        result.error = EdlError::protocol(
            QString("Truncated Sahara header: %1 bytes").arg(data.size()), data);
        return result;
    }

    const auto* d = reinterpret_cast<const uchar*>(data.constData());
    const uint32_t id = qFromLittleEndian<quint32>(d);
    const uint32_t declared = qFromLittleEndian<quint32>(d + 4);

    const Schema* schema = schemaFor(id);
    if (!schema) {
        result.error = EdlError::protocol(
            QString("Unknown Sahara command 0x%1").arg(id, 2, 16, QChar('0')), data);
        return result;
    }

    const int expected = schemaBytes(*schema);
    if (declared != static_cast<uint32_t>(expected)) {
        result.error = EdlError::protocol(
            QString("%1 declares length %2, schema requires %3")
                .arg(commandName(id)).arg(declared).arg(expected), data);
        return result;
    }
    if (data.size() < expected) {
        result.error = EdlError::protocol(
            QString("Truncated %1: %2 of %3 bytes")
                .arg(commandName(id)).arg(data.size()).arg(expected), data);
        return result;
    }
    if (data.size() > expected) {
        result.error = EdlError::protocol(
            QString("%1 followed by %2 trailing bytes")
                .arg(commandName(id)).arg(data.size() - expected), data);
        return result;
    }

    SaharaPacket& p = result.packet;
    p.command = static_cast<SaharaCommand>(id);
    p.length = declared;

    int pos = HEADER_SIZE;
    for (const FieldSpec& spec : *schema) {
        const uint64_t value = (spec.width == 8)
            ? qFromLittleEndian<quint64>(d + pos)
            : qFromLittleEndian<quint32>(d + pos);
        setField(p, spec.field, value);
        pos += spec.width;
    }

    result.success = true;
    return result;
}

uint32_t SaharaCodec::peekLength(const QByteArray& buffer)
{
    if (buffer.size() < HEADER_SIZE)
        return 0;
    return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(buffer.constData()) + 4);
}

uint32_t SaharaCodec::peekCommand(const QByteArray& buffer)
{
    if (buffer.size() < 4)
        return 0;
    return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(buffer.constData()));
}

// ─── Builders ────────────────────────────────────────────────────────

SaharaPacket SaharaCodec::helloResponse(SaharaMode mode, uint32_t version, uint32_t versionMin,
                                        SaharaStatus status)
{
    SaharaPacket p;
    p.command = SaharaCommand::HelloResponse;
    p.length = static_cast<uint32_t>(packetSize(static_cast<uint32_t>(p.command)));
    p.version = version;
    p.versionMin = versionMin;
    p.status = static_cast<uint32_t>(status);
    p.mode = static_cast<uint32_t>(mode);
    return p;
}

static SaharaPacket bare(SaharaCommand command)
{
    SaharaPacket p;
    p.command = command;
    p.length = SaharaCodec::HEADER_SIZE;
    return p;
}

SaharaPacket SaharaCodec::done()
{
    return bare(SaharaCommand::Done);
}

SaharaPacket SaharaCodec::reset()
{
    return bare(SaharaCommand::Reset);
}

SaharaPacket SaharaCodec::resetStateMachine()
{
    return bare(SaharaCommand::ResetStateMachine);
}

SaharaPacket SaharaCodec::switchMode(SaharaMode mode)
{
    SaharaPacket p;
    p.command = SaharaCommand::SwitchMode;
    p.length = static_cast<uint32_t>(packetSize(static_cast<uint32_t>(p.command)));
    p.mode = static_cast<uint32_t>(mode);
    return p;
}

SaharaPacket SaharaCodec::execute(SaharaExecCommand cmd)
{
    SaharaPacket p;
    p.command = SaharaCommand::Execute;
    p.length = static_cast<uint32_t>(packetSize(static_cast<uint32_t>(p.command)));
    p.clientCommand = static_cast<uint32_t>(cmd);
    return p;
}

SaharaPacket SaharaCodec::executeResponse(SaharaExecCommand cmd)
{
    SaharaPacket p = execute(cmd);
    p.command = SaharaCommand::ExecuteResponse;
    return p;
}

QString SaharaCodec::statusName(uint32_t status)
{
    switch (static_cast<SaharaStatus>(status)) {
    case SaharaStatus::Success:            return QStringLiteral("success");
    case SaharaStatus::InvalidCommand:     return QStringLiteral("invalid command");
    case SaharaStatus::ProtocolMismatch:   return QStringLiteral("protocol mismatch");
    case SaharaStatus::InvalidTargetProto: return QStringLiteral("invalid target protocol");
    case SaharaStatus::InvalidHostProto:   return QStringLiteral("invalid host protocol");
    case SaharaStatus::InvalidPacketSize:  return QStringLiteral("invalid packet size");
    case SaharaStatus::UnexpectedImageId:  return QStringLiteral("unexpected image id");
    case SaharaStatus::InvalidHeaderSize:  return QStringLiteral("invalid header size");
    case SaharaStatus::InvalidDataSize:    return QStringLiteral("invalid data size");
    case SaharaStatus::InvalidImageType:   return QStringLiteral("invalid image type");
    case SaharaStatus::InvalidTxLength:    return QStringLiteral("invalid tx length");
    case SaharaStatus::InvalidRxLength:    return QStringLiteral("invalid rx length");
    case SaharaStatus::GeneralTxError:     return QStringLiteral("general tx error");
    case SaharaStatus::GeneralRxError:     return QStringLiteral("general rx error");
    case SaharaStatus::CmdSwitchFailed:    return QStringLiteral("command mode switch failed");
    case SaharaStatus::InvalidMode:        return QStringLiteral("invalid mode");
    case SaharaStatus::ExecCmdFailed:      return QStringLiteral("execute command failed");
    case SaharaStatus::ExecDataInvalid:    return QStringLiteral("execute data invalid");
    case SaharaStatus::HashMismatch:       return QStringLiteral("hash mismatch");
    case SaharaStatus::HashUnsupported:    return QStringLiteral("hash unsupported");
    }
    return QString("status 0x%1").arg(status, 2, 16, QChar('0'));
}

} // namespace edlkit
