#pragma once

#include "sahara_packet.h"
#include "common/edl_error.h"

#include <QString>
#include <cstdint>

namespace edlkit {

enum class SaharaState {
    Idle,
    AwaitHello,
    AwaitCommandReady,
    CommandMode,
    AwaitExecuteData,
    AwaitLoaderRequests,
    AwaitEndOfImage,
    AwaitResetAck,
    Done,
    Failed,
};

enum class SaharaAction {
    None,
    SendPacket,          // write step.reply
    SendImageData,       // write image bytes [dataOffset, dataOffset + dataLength)
    ReceiveExecuteData,  // write step.reply, then read dataLength raw bytes
};

struct SaharaStep {
    SaharaAction action = SaharaAction::None;
    SaharaPacket reply;
    uint64_t dataOffset = 0;
    uint64_t dataLength = 0;
    EdlError error;   // set when the step was refused or moved the machine to Failed
};

// Host side of the Sahara exchange as a pure transition function of
// (state, received packet). It performs no I/O; SaharaClient executes the steps.
class SaharaStateMachine {
public:
    static constexpr uint32_t HOST_VERSION = 2;
    static constexpr uint32_t HOST_VERSION_MIN = 1;

    SaharaState state() const { return m_state; }
    bool isTerminal() const { return m_state == SaharaState::Done || m_state == SaharaState::Failed; }

    // Size of the loader image served to ReadData requests.
    void setImageSize(uint64_t size) { m_imageSize = size; }
    uint64_t imageSize() const { return m_imageSize; }

    // Mode the next Hello is answered with (ImageTransferPending or Command).
    void setRequestedMode(SaharaMode mode) { m_requestedMode = mode; }
    SaharaMode requestedMode() const { return m_requestedMode; }

    SaharaStep onPacket(const SaharaPacket& packet);

    // ── Host-initiated transitions ───────────────────────────────────
    SaharaStep requestReset();                       // any state -> AwaitResetAck
    SaharaStep requestSoftReset();                   // any state -> AwaitHello
    SaharaStep requestExecute(SaharaExecCommand cmd); // CommandMode -> AwaitExecuteData
    SaharaStep requestSwitchMode(SaharaMode mode);   // CommandMode -> AwaitHello
    void fail(const EdlError& error);

    const EdlError& error() const { return m_error; }
    bool hasLastPacket() const { return m_hasLastPacket; }
    const SaharaPacket& lastPacket() const { return m_lastPacket; }
    const SaharaPacket& helloPacket() const { return m_hello; }
    bool commandModeDeclined() const { return m_commandModeDeclined; }
    uint32_t imageTxStatus() const { return m_imageTxStatus; }

    static QString stateName(SaharaState state);

private:
    SaharaStep onHello(const SaharaPacket& packet);
    SaharaStep onReadData(const SaharaPacket& packet);
    SaharaStep onEndImageTransfer(const SaharaPacket& packet);
    SaharaStep unexpected(const SaharaPacket& packet);
    SaharaStep failWith(const EdlError& error);
    SaharaStep refuse(const QString& what) const;

    SaharaState m_state = SaharaState::Idle;
    SaharaMode m_requestedMode = SaharaMode::ImageTransferPending;
    uint64_t m_imageSize = 0;
    uint32_t m_pendingExec = 0;
    uint32_t m_imageTxStatus = 0;
    bool m_commandModeDeclined = false;

    SaharaPacket m_hello;
    SaharaPacket m_lastPacket;
    bool m_hasLastPacket = false;
    EdlError m_error;
};

} // namespace edlkit
