#include "sahara_state_machine.h"

namespace edlkit {

QString SaharaStateMachine::stateName(SaharaState state)
{
    switch (state) {
    case SaharaState::Idle:                return QStringLiteral("Idle");
    case SaharaState::AwaitHello:          return QStringLiteral("AwaitHello");
    case SaharaState::AwaitCommandReady:   return QStringLiteral("AwaitCommandReady");
    case SaharaState::CommandMode:         return QStringLiteral("CommandMode");
    case SaharaState::AwaitExecuteData:    return QStringLiteral("AwaitExecuteData");
    case SaharaState::AwaitLoaderRequests: return QStringLiteral("AwaitLoaderRequests");
    case SaharaState::AwaitEndOfImage:     return QStringLiteral("AwaitEndOfImage");
    case SaharaState::AwaitResetAck:       return QStringLiteral("AwaitResetAck");
    case SaharaState::Done:                return QStringLiteral("Done");
    case SaharaState::Failed:              return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

// ─── Device-driven transitions ───────────────────────────────────────

SaharaStep SaharaStateMachine::onPacket(const SaharaPacket& packet)
{
    m_lastPacket = packet;
    m_hasLastPacket = true;

    switch (m_state) {
    case SaharaState::Idle:
    case SaharaState::AwaitHello:
        if (packet.command == SaharaCommand::Hello)
            return onHello(packet);
        break;

    case SaharaState::AwaitCommandReady:
        if (packet.command == SaharaCommand::CommandReady) {
            m_state = SaharaState::CommandMode;
            return {};
        }
        // The device declined command mode and went straight to image transfer
        if (packet.command == SaharaCommand::ReadData ||
            packet.command == SaharaCommand::ReadData64) {
            m_commandModeDeclined = true;
            m_state = SaharaState::AwaitLoaderRequests;
            return onReadData(packet);
        }
        if (packet.command == SaharaCommand::EndImageTransfer) {
            m_commandModeDeclined = true;
            m_state = SaharaState::AwaitLoaderRequests;
            return onEndImageTransfer(packet);
        }
        break;

    case SaharaState::AwaitExecuteData:
        if (packet.command == SaharaCommand::ExecuteData) {
            if (packet.clientCommand != m_pendingExec) {
                return failWith(EdlError::protocol(
                    QString("ExecuteData echoes command 0x%1, expected 0x%2")
                        .arg(packet.clientCommand, 2, 16, QChar('0'))
                        .arg(m_pendingExec, 2, 16, QChar('0')),
                    SaharaCodec::encode(packet)));
            }
            SaharaStep step;
            step.action = SaharaAction::ReceiveExecuteData;
            step.reply = SaharaCodec::executeResponse(static_cast<SaharaExecCommand>(m_pendingExec));
            step.dataLength = packet.dataLength;
            m_state = SaharaState::CommandMode;
            return step;
        }
        break;

    case SaharaState::AwaitLoaderRequests:
        if (packet.command == SaharaCommand::ReadData ||
            packet.command == SaharaCommand::ReadData64)
            return onReadData(packet);
        if (packet.command == SaharaCommand::EndImageTransfer)
            return onEndImageTransfer(packet);
        break;

    case SaharaState::AwaitEndOfImage:
        if (packet.command == SaharaCommand::DoneResponse) {
            m_imageTxStatus = packet.status;
            m_state = SaharaState::Done;
            return {};
        }
        break;

    case SaharaState::AwaitResetAck:
        if (packet.command == SaharaCommand::ResetResponse) {
            m_state = SaharaState::Done;
            return {};
        }
        break;

    case SaharaState::CommandMode:
    case SaharaState::Done:
    case SaharaState::Failed:
        break;
    }

    return unexpected(packet);
}

SaharaStep SaharaStateMachine::onHello(const SaharaPacket& packet)
{
    m_hello = packet;

    if (packet.mode == static_cast<uint32_t>(SaharaMode::MemoryDebug)) {
        return failWith(EdlError::unsupported(
            "Device offers memory debug mode; memory dumps are not supported"));
    }
    if (packet.versionMin > HOST_VERSION) {
        return failWith(EdlError::unsupported(
            QString("Device requires Sahara v%1 or newer, host speaks v%2")
                .arg(packet.versionMin).arg(HOST_VERSION)));
    }

    SaharaStep step;
    step.action = SaharaAction::SendPacket;
    step.reply = SaharaCodec::helloResponse(m_requestedMode, HOST_VERSION, HOST_VERSION_MIN);
    m_state = (m_requestedMode == SaharaMode::Command)
                  ? SaharaState::AwaitCommandReady
                  : SaharaState::AwaitLoaderRequests;
    return step;
}

SaharaStep SaharaStateMachine::onReadData(const SaharaPacket& packet)
{
    // Out-of-range requests are never clamped
    if (packet.offset > m_imageSize || packet.size > m_imageSize - packet.offset) {
        return failWith(EdlError::protocol(
            QString("%1 requests [%2, %3) outside the %4-byte image")
                .arg(SaharaCodec::commandName(packet.command))
                .arg(packet.offset).arg(packet.offset + packet.size).arg(m_imageSize),
            SaharaCodec::encode(packet)));
    }

    SaharaStep step;
    step.action = SaharaAction::SendImageData;
    step.dataOffset = packet.offset;
    step.dataLength = packet.size;
    return step;
}

SaharaStep SaharaStateMachine::onEndImageTransfer(const SaharaPacket& packet)
{
    if (packet.status != static_cast<uint32_t>(SaharaStatus::Success)) {
        return failWith(EdlError::rejected(
            QString("Image transfer failed: %1").arg(SaharaCodec::statusName(packet.status)),
            SaharaCodec::encode(packet)));
    }

    SaharaStep step;
    step.action = SaharaAction::SendPacket;
    step.reply = SaharaCodec::done();
    m_state = SaharaState::AwaitEndOfImage;
    return step;
}

SaharaStep SaharaStateMachine::unexpected(const SaharaPacket& packet)
{
    return failWith(EdlError::protocol(
        QString("Unexpected %1 in state %2")
            .arg(SaharaCodec::commandName(packet.command), stateName(m_state)),
        SaharaCodec::encode(packet)));
}

SaharaStep SaharaStateMachine::failWith(const EdlError& error)
{
    fail(error);
    SaharaStep step;
    step.error = error;
    return step;
}

void SaharaStateMachine::fail(const EdlError& error)
{
    // Keep the first cause; later failures are consequences of it
    if (m_state != SaharaState::Failed)
        m_error = error;
    m_state = SaharaState::Failed;
}

// ─── Host-initiated transitions ──────────────────────────────────────

SaharaStep SaharaStateMachine::refuse(const QString& what) const
{
    SaharaStep step;
    step.error = EdlError::usage(QString("%1 is not possible in state %2").arg(what, stateName(m_state)));
    return step;
}

SaharaStep SaharaStateMachine::requestReset()
{
    SaharaStep step;
    step.action = SaharaAction::SendPacket;
    step.reply = SaharaCodec::reset();
    m_state = SaharaState::AwaitResetAck;
    m_error = {};
    return step;
}

SaharaStep SaharaStateMachine::requestSoftReset()
{
    SaharaStep step;
    step.action = SaharaAction::SendPacket;
    step.reply = SaharaCodec::resetStateMachine();
    m_state = SaharaState::AwaitHello;
    m_error = {};
    return step;
}

SaharaStep SaharaStateMachine::requestExecute(SaharaExecCommand cmd)
{
    if (m_state != SaharaState::CommandMode)
        return refuse(QStringLiteral("Execute"));

    SaharaStep step;
    step.action = SaharaAction::SendPacket;
    step.reply = SaharaCodec::execute(cmd);
    m_pendingExec = static_cast<uint32_t>(cmd);
    m_state = SaharaState::AwaitExecuteData;
    return step;
}

SaharaStep SaharaStateMachine::requestSwitchMode(SaharaMode mode)
{
    if (m_state != SaharaState::CommandMode)
        return refuse(QStringLiteral("SwitchMode"));

    SaharaStep step;
    step.action = SaharaAction::SendPacket;
    step.reply = SaharaCodec::switchMode(mode);
    m_requestedMode = mode;
    m_state = SaharaState::AwaitHello;
    return step;
}

} // namespace edlkit
