#pragma once

#include "common/edl_error.h"

#include <QByteArray>
#include <QString>
#include <array>
#include <cstdint>

namespace edlkit {

// ─── Sahara command IDs ──────────────────────────────────────────────
enum class SaharaCommand : uint32_t {
    Hello              = 0x01,
    HelloResponse      = 0x02,
    ReadData           = 0x03,  // 32-bit read (older PBLs)
    EndImageTransfer   = 0x04,
    Done               = 0x05,
    DoneResponse       = 0x06,
    Reset              = 0x07,
    ResetResponse      = 0x08,
    MemoryDebug        = 0x09,
    MemoryRead         = 0x0A,
    CommandReady       = 0x0B,
    SwitchMode         = 0x0C,
    Execute            = 0x0D,
    ExecuteData        = 0x0E,
    ExecuteResponse    = 0x0F,
    MemoryDebug64      = 0x10,
    MemoryRead64       = 0x11,
    ReadData64         = 0x12,
    ResetStateMachine  = 0x13,
};

enum class SaharaMode : uint32_t {
    ImageTransferPending  = 0x0,
    ImageTransferComplete = 0x1,
    MemoryDebug           = 0x2,
    Command               = 0x3,
};

enum class SaharaExecCommand : uint32_t {
    SerialNumRead   = 0x01,
    MsmHwIdRead     = 0x02,  // v1/v2 only
    OemPkHashRead   = 0x03,
    SblInfoRead     = 0x06,  // v3 only
    SblSwVersion    = 0x07,  // v1/v2 only
    PblSwVersion    = 0x08,
    ChipIdV3Read    = 0x0A,  // v3 only
};

enum class SaharaStatus : uint32_t {
    Success             = 0x00,
    InvalidCommand      = 0x01,
    ProtocolMismatch    = 0x02,
    InvalidTargetProto  = 0x03,
    InvalidHostProto    = 0x04,
    InvalidPacketSize   = 0x05,
    UnexpectedImageId   = 0x06,
    InvalidHeaderSize   = 0x07,
    InvalidDataSize     = 0x08,
    InvalidImageType    = 0x09,
    InvalidTxLength     = 0x0A,
    InvalidRxLength     = 0x0B,
    GeneralTxError      = 0x0C,
    GeneralRxError      = 0x0D,
    CmdSwitchFailed     = 0x12,
    InvalidMode         = 0x18,
    ExecCmdFailed       = 0x1C,
    ExecDataInvalid     = 0x1D,
    HashMismatch        = 0x1E,
    HashUnsupported     = 0x1F,
};

// Decoded Sahara packet. Only the fields in the command's schema are meaningful;
// the rest stay zero so that decoded packets compare equal field by field.
struct SaharaPacket {
    SaharaCommand command = SaharaCommand::Hello;
    uint32_t length = 0;

    uint32_t version = 0;           // Hello, HelloResponse
    uint32_t versionMin = 0;        // Hello, HelloResponse
    uint32_t maxCommandLength = 0;  // Hello
    uint32_t mode = 0;              // Hello, HelloResponse, SwitchMode
    uint32_t status = 0;            // HelloResponse, EndImageTransfer, DoneResponse
    std::array<uint32_t, 6> reserved{};

    uint64_t imageId = 0;           // ReadData(64), EndImageTransfer
    uint64_t offset = 0;            // ReadData(64); table/region address for memory debug
    uint64_t size = 0;              // ReadData(64); table/region length for memory debug

    uint32_t clientCommand = 0;     // Execute, ExecuteData, ExecuteResponse
    uint32_t dataLength = 0;        // ExecuteData

    bool operator==(const SaharaPacket& other) const;
    bool operator!=(const SaharaPacket& other) const { return !(*this == other); }
};

struct SaharaDecodeResult {
    bool success = false;
    SaharaPacket packet;
    EdlError error;
};

class SaharaCodec {
public:
    static constexpr int HEADER_SIZE = 8;

    // Schema size (header included) of a command, or -1 for an unknown id.
    static int packetSize(uint32_t commandId);
    static bool isKnownCommand(uint32_t commandId) { return packetSize(commandId) > 0; }
    static QString commandName(uint32_t commandId);
    static QString commandName(SaharaCommand command) { return commandName(static_cast<uint32_t>(command)); }

    // Writes exactly packetSize(command) bytes; packet.length is ignored.
    static QByteArray encode(const SaharaPacket& packet);

    // Input must hold exactly one packet: short input, an unknown command, a declared
    // length that differs from the schema, or trailing bytes are protocol violations.
    static SaharaDecodeResult decode(const QByteArray& data);

    // Reads the declared total length from a buffered header; 0 if fewer than 8 bytes.
    static uint32_t peekLength(const QByteArray& buffer);
    static uint32_t peekCommand(const QByteArray& buffer);

    // ── Host-side packet builders ────────────────────────────────────
    static SaharaPacket helloResponse(SaharaMode mode, uint32_t version, uint32_t versionMin,
                                      SaharaStatus status = SaharaStatus::Success);
    static SaharaPacket done();
    static SaharaPacket reset();
    static SaharaPacket resetStateMachine();
    static SaharaPacket switchMode(SaharaMode mode);
    static SaharaPacket execute(SaharaExecCommand cmd);
    static SaharaPacket executeResponse(SaharaExecCommand cmd);

    static QString statusName(uint32_t status);
};

} // namespace edlkit
