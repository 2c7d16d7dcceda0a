#include "sahara_protocol.h"
#include "transport/i_transport.h"
#include "core/logger.h"

#include <QtEndian>

static const QString TAG = QStringLiteral("Sahara");

namespace edlkit {

SaharaClient::SaharaClient(ITransport* transport, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
{
    Q_ASSERT(transport);
}

void SaharaClient::setTimeouts(int helloMs, int packetMs)
{
    m_helloTimeoutMs = helloMs;
    m_packetTimeoutMs = packetMs;
}

void SaharaClient::setLoader(const QByteArray& loader)
{
    m_loader = loader;
    m_machine.setImageSize(static_cast<uint64_t>(loader.size()));
}

QByteArray SaharaClient::takeUnconsumed()
{
    QByteArray rest = m_rx;
    m_rx.clear();
    return rest;
}

// ─── Low-level I/O helpers ───────────────────────────────────────────

bool SaharaClient::fill(int size, int timeoutMs, EdlError& error)
{
    while (m_rx.size() < size) {
        QByteArray chunk = m_transport->read(READ_CHUNK, timeoutMs);
        if (chunk.isEmpty()) {
            const TransportStatus status = m_transport->status();
            error = EdlError::transport(
                status == TransportStatus::Timeout
                    ? QString("Timed out after %1 ms in state %2 (%3 of %4 bytes buffered)")
                          .arg(timeoutMs).arg(SaharaStateMachine::stateName(m_machine.state()))
                          .arg(m_rx.size()).arg(size)
                    : QString("Read failed: %1").arg(transportStatusName(status)));
            error.rawData = m_rx;
            return false;
        }
        m_rx.append(chunk);
    }
    return true;
}

bool SaharaClient::receivePacket(int timeoutMs, SaharaPacket& packet, EdlError& error)
{
    if (!fill(SaharaCodec::HEADER_SIZE, timeoutMs, error))
        return false;

    // Unknown ids and bad lengths are judged from the header alone
    const int expected = SaharaCodec::packetSize(SaharaCodec::peekCommand(m_rx));
    if (expected < 0 || SaharaCodec::peekLength(m_rx) != static_cast<uint32_t>(expected)) {
        error = SaharaCodec::decode(m_rx.left(SaharaCodec::HEADER_SIZE)).error;
        return false;
    }

    if (!fill(expected, timeoutMs, error))
        return false;

    SaharaDecodeResult decoded = SaharaCodec::decode(m_rx.left(expected));
    m_rx.remove(0, expected);
    if (!decoded.success) {
        error = decoded.error;
        return false;
    }

    packet = decoded.packet;
    LOG_DEBUG_CAT(TAG, QString("RX %1 (%2 bytes)")
                           .arg(SaharaCodec::commandName(packet.command)).arg(expected));
    return true;
}

bool SaharaClient::receiveRaw(int size, int timeoutMs, QByteArray& out, EdlError& error)
{
    if (!fill(size, timeoutMs, error))
        return false;
    out = m_rx.left(size);
    m_rx.remove(0, size);
    return true;
}

bool SaharaClient::writeAll(const QByteArray& data, EdlError& error)
{
    const qint64 written = m_transport->write(data, m_packetTimeoutMs);
    if (written != data.size()) {
        error = EdlError::transport(QString("Short write: %1 of %2 bytes (%3)")
                                        .arg(written).arg(data.size())
                                        .arg(transportStatusName(m_transport->status())));
        return false;
    }
    return true;
}

bool SaharaClient::sendPacket(const SaharaPacket& packet, EdlError& error)
{
    LOG_DEBUG_CAT(TAG, "TX " + SaharaCodec::commandName(packet.command));
    return writeAll(SaharaCodec::encode(packet), error);
}

// ─── Step execution ──────────────────────────────────────────────────

bool SaharaClient::perform(const SaharaStep& step, EdlError& error)
{
    switch (step.action) {
    case SaharaAction::None:
        return true;

    case SaharaAction::SendPacket:
        return sendPacket(step.reply, error);

    case SaharaAction::SendImageData: {
        if (step.dataLength == 0)
            return true;
        const QByteArray chunk = m_loader.mid(static_cast<int>(step.dataOffset),
                                              static_cast<int>(step.dataLength));
        if (!writeAll(chunk, error))
            return false;
        m_served += chunk.size();
        emit uploadProgress(m_served, m_loader.size());
        return true;
    }

    case SaharaAction::ReceiveExecuteData:
        m_execData.clear();
        if (!sendPacket(step.reply, error))
            return false;
        return receiveRaw(static_cast<int>(step.dataLength), m_packetTimeoutMs, m_execData, error);
    }
    return true;
}

SaharaResult SaharaClient::current() const
{
    SaharaResult result;
    result.state = m_machine.state();
    result.success = result.state != SaharaState::Failed;
    result.error = m_machine.error();
    return result;
}

SaharaResult SaharaClient::fail(const EdlError& error)
{
    m_machine.fail(error);
    LOG_ERROR_CAT(TAG, error.toString());

    SaharaResult result;
    result.state = m_machine.state();
    result.error = error;
    return result;
}

SaharaResult SaharaClient::pumpUntil(const std::function<bool(SaharaState)>& done)
{
    while (!done(m_machine.state()) && !m_machine.isTerminal()) {
        const bool waitingForHello = m_machine.state() == SaharaState::Idle ||
                                     m_machine.state() == SaharaState::AwaitHello;
        SaharaPacket packet;
        EdlError error;
        if (!receivePacket(waitingForHello ? m_helloTimeoutMs : m_packetTimeoutMs, packet, error))
            return fail(error);

        if (packet.command == SaharaCommand::Hello) {
            m_deviceInfo.version = packet.version;
            m_deviceInfo.versionMin = packet.versionMin;
            m_deviceInfo.maxCommandLength = packet.maxCommandLength;
            LOG_INFO_CAT(TAG, QString("Device Sahara v%1 (min %2), mode=%3, maxCmd=%4")
                                  .arg(packet.version).arg(packet.versionMin)
                                  .arg(packet.mode).arg(packet.maxCommandLength));
        }

        const SaharaStep step = m_machine.onPacket(packet);
        if (step.error.isError())
            return fail(step.error);
        if (!perform(step, error))
            return fail(error);
    }

    if (m_machine.state() == SaharaState::Failed)
        return fail(m_machine.error());
    return current();
}

// ─── Loader upload ───────────────────────────────────────────────────

SaharaResult SaharaClient::uploadLoader()
{
    const SaharaState s = m_machine.state();
    if (s != SaharaState::Idle && s != SaharaState::AwaitHello &&
        s != SaharaState::AwaitLoaderRequests) {
        SaharaResult result = current();
        result.success = false;
        result.error = EdlError::usage(
            "Cannot upload a loader in state " + SaharaStateMachine::stateName(s));
        return result;
    }
    if (m_loader.isEmpty()) {
        SaharaResult result = current();
        result.success = false;
        result.error = EdlError::usage("No loader image set");
        return result;
    }

    LOG_INFO_CAT(TAG, QString("Uploading loader (%1 bytes)").arg(m_loader.size()));
    m_machine.setRequestedMode(SaharaMode::ImageTransferPending);
    m_served = 0;

    SaharaResult result = pumpUntil([](SaharaState st) { return st == SaharaState::Done; });
    if (result.success) {
        LOG_INFO_CAT(TAG, QString("Loader accepted, %1 bytes served, imageTxStatus=%2")
                              .arg(m_served).arg(m_machine.imageTxStatus()));
    }
    return result;
}

// ─── Command mode ────────────────────────────────────────────────────
// Execute (0x0D) -> ExecuteData (0x0E) -> ExecuteResponse (0x0F) -> raw data

bool SaharaClient::executeCommand(SaharaExecCommand cmd, QByteArray& out, EdlError& error)
{
    SaharaStep step = m_machine.requestExecute(cmd);
    if (step.error.isError()) {
        error = step.error;
        return false;
    }
    if (!perform(step, error))
        return false;

    SaharaPacket packet;
    if (!receivePacket(m_packetTimeoutMs, packet, error))
        return false;

    step = m_machine.onPacket(packet);
    if (step.error.isError()) {
        error = step.error;
        return false;
    }
    if (!perform(step, error))
        return false;

    out = m_execData;
    LOG_DEBUG_CAT(TAG, QString("Execute 0x%1 returned %2 bytes")
                           .arg(static_cast<uint32_t>(cmd), 2, 16, QChar('0')).arg(out.size()));
    return true;
}

SaharaResult SaharaClient::readDeviceInfo()
{
    const SaharaState s = m_machine.state();
    if (s != SaharaState::Idle && s != SaharaState::AwaitHello) {
        SaharaResult result = current();
        result.success = false;
        result.error = EdlError::usage(
            "Device info is only readable before the first HelloResponse, state is " +
            SaharaStateMachine::stateName(s));
        return result;
    }

    LOG_INFO_CAT(TAG, "Requesting command mode for device info");
    m_machine.setRequestedMode(SaharaMode::Command);
    m_served = 0;

    SaharaResult result = pumpUntil([](SaharaState st) {
        return st == SaharaState::CommandMode || st == SaharaState::Done;
    });
    if (!result.success)
        return result;

    if (m_machine.state() == SaharaState::Done) {
        LOG_INFO_CAT(TAG, "Device declined command mode, loader uploaded instead");
        m_deviceInfo.commandModeAvailable = false;
        return result;
    }

    m_deviceInfo.commandModeAvailable = true;
    EdlError error;
    if (!readChipInfo(error))
        return fail(error);

    const SaharaStep step = m_machine.requestSwitchMode(SaharaMode::ImageTransferPending);
    if (step.error.isError())
        return fail(step.error);
    if (!perform(step, error))
        return fail(error);

    return current();
}

bool SaharaClient::readChipInfo(EdlError& error)
{
    QByteArray data;
    if (!executeCommand(SaharaExecCommand::SerialNumRead, data, error))
        return false;
    parseSerial(data);

    if (!executeCommand(SaharaExecCommand::OemPkHashRead, data, error))
        return false;
    m_deviceInfo.pkHash = data.left(48);

    // v3 dropped MSM HW id read in favour of the extended chip id
    if (m_deviceInfo.version < 3) {
        if (!executeCommand(SaharaExecCommand::MsmHwIdRead, data, error))
            return false;
        parseHwIdV1V2(data);
    } else {
        if (!executeCommand(SaharaExecCommand::ChipIdV3Read, data, error))
            return false;
        parseChipIdV3(data);
    }

    LOG_INFO_CAT(TAG, "─── Sahara Device Info ───");
    LOG_INFO_CAT(TAG, QString("  Serial   : %1").arg(m_deviceInfo.serialHex()));
    LOG_INFO_CAT(TAG, QString("  MSM HWID : 0x%1 | model_id:0x%2 | oem_id:0x%3")
                          .arg(m_deviceInfo.msmId, 8, 16, QChar('0'))
                          .arg(m_deviceInfo.modelId, 4, 16, QChar('0'))
                          .arg(m_deviceInfo.oemId, 4, 16, QChar('0')));
    LOG_INFO_CAT(TAG, QString("  PK hash  : %1").arg(m_deviceInfo.pkHashHex()));
    return true;
}

void SaharaClient::parseSerial(const QByteArray& data)
{
    m_deviceInfo.serialRaw = data;
    if (data.size() >= 4)
        m_deviceInfo.serial = qFromLittleEndian<quint32>(data.constData());
}

// 8 bytes LE: bits 0-31 MSM id, 32-47 OEM id, 48-63 model id
void SaharaClient::parseHwIdV1V2(const QByteArray& data)
{
    m_deviceInfo.hwIdRaw = data;
    if (data.size() < 8)
        return;

    const quint64 hwid = qFromLittleEndian<quint64>(data.constData());
    m_deviceInfo.msmId = static_cast<uint32_t>(hwid & 0xFFFFFFFF);
    m_deviceInfo.oemId = static_cast<uint16_t>((hwid >> 32) & 0xFFFF);
    m_deviceInfo.modelId = static_cast<uint16_t>((hwid >> 48) & 0xFFFF);
    m_deviceInfo.hwIdHex = "0x" + QString("%1").arg(hwid, 16, 16, QChar('0')).toUpper();
}

// MSM id at offset 36, OEM id at 40 (44 when 40 is blank), model id at 42
void SaharaClient::parseChipIdV3(const QByteArray& data)
{
    m_deviceInfo.hwIdRaw = data;
    if (data.size() < 44)
        return;

    const char* d = data.constData();
    const uint32_t msm = qFromLittleEndian<quint32>(d + 36);
    uint16_t oem = qFromLittleEndian<quint16>(d + 40);
    const uint16_t model = qFromLittleEndian<quint16>(d + 42);
    if (oem == 0 && data.size() >= 46) {
        const uint16_t alt = qFromLittleEndian<quint16>(d + 44);
        if (alt > 0 && alt < 0x1000)
            oem = alt;
    }

    m_deviceInfo.msmId = msm;
    m_deviceInfo.oemId = oem;
    m_deviceInfo.modelId = model;
    m_deviceInfo.hwIdHex = "0x" + QString("00%1%2%3")
                                      .arg(msm, 6, 16, QChar('0'))
                                      .arg(oem, 4, 16, QChar('0'))
                                      .arg(model, 4, 16, QChar('0'))
                                      .toUpper();
}

// ─── Resets ──────────────────────────────────────────────────────────

SaharaResult SaharaClient::reset()
{
    LOG_INFO_CAT(TAG, "Sending Sahara hard reset");
    m_rx.clear();
    const SaharaStep step = m_machine.requestReset();
    EdlError error;
    if (!perform(step, error))
        return fail(error);

    SaharaResult result = pumpUntil([](SaharaState st) { return st == SaharaState::Done; });
    if (result.success)
        LOG_INFO_CAT(TAG, "Reset acknowledged");
    return result;
}

SaharaResult SaharaClient::softReset()
{
    LOG_INFO_CAT(TAG, "Sending Sahara state machine reset");
    const SaharaStep step = m_machine.requestSoftReset();
    EdlError error;
    if (!perform(step, error))
        return fail(error);
    m_rx.clear();
    return current();
}

} // namespace edlkit
