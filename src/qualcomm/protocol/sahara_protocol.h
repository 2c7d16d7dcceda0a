#pragma once

#include "sahara_packet.h"
#include "sahara_state_machine.h"
#include "common/edl_error.h"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <cstdint>
#include <functional>

namespace edlkit {

class ITransport;

// ─── Device info gathered in Sahara command mode ─────────────────────
struct SaharaDeviceInfo {
    uint32_t version = 0;
    uint32_t versionMin = 0;
    uint32_t maxCommandLength = 0;
    bool commandModeAvailable = false;

    uint32_t serial = 0;
    QByteArray pkHash;
    uint32_t msmId = 0;
    uint16_t oemId = 0;
    uint16_t modelId = 0;
    QString hwIdHex;

    QByteArray serialRaw;
    QByteArray hwIdRaw;

    QString serialHex() const { return QString("0x%1").arg(serial, 8, 16, QChar('0')); }
    QString pkHashHex() const { return QString::fromLatin1(pkHash.toHex()); }
};

struct SaharaResult {
    bool success = false;
    SaharaState state = SaharaState::Idle;
    EdlError error;
};

// ─── Sahara client ───────────────────────────────────────────────────
// Drives SaharaStateMachine over a transport. Packets are re-framed from an
// internal receive buffer, so reads may split or merge packets freely.
class SaharaClient : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_HELLO_TIMEOUT_MS = 60000;
    static constexpr int DEFAULT_PACKET_TIMEOUT_MS = 30000;

    explicit SaharaClient(ITransport* transport, QObject* parent = nullptr);

    void setTimeouts(int helloMs, int packetMs);

    // Image served to ReadData/ReadData64 requests.
    void setLoader(const QByteArray& loader);

    // Runs the handshake and loader upload until DoneResponse.
    SaharaResult uploadLoader();

    // Enters command mode from the first Hello, reads serial, PK hash and HW id, then
    // switches back to image transfer (state AwaitHello). A device that declines
    // command mode starts pulling the loader instead; the upload is completed.
    SaharaResult readDeviceInfo();

    // Hard reset (0x07): succeeds once ResetResponse arrives.
    SaharaResult reset();
    // State machine reset (0x13): the device restarts with a new Hello.
    SaharaResult softReset();

    SaharaState state() const { return m_machine.state(); }
    const SaharaStateMachine& stateMachine() const { return m_machine; }
    const SaharaDeviceInfo& deviceInfo() const { return m_deviceInfo; }

    // Bytes received past the last Sahara packet, for the next protocol layer.
    QByteArray takeUnconsumed();

signals:
    void uploadProgress(qint64 sent, qint64 total);

private:
    SaharaResult pumpUntil(const std::function<bool(SaharaState)>& done);
    bool perform(const SaharaStep& step, EdlError& error);
    bool receivePacket(int timeoutMs, SaharaPacket& packet, EdlError& error);
    bool receiveRaw(int size, int timeoutMs, QByteArray& out, EdlError& error);
    bool fill(int size, int timeoutMs, EdlError& error);
    bool sendPacket(const SaharaPacket& packet, EdlError& error);
    bool writeAll(const QByteArray& data, EdlError& error);
    bool executeCommand(SaharaExecCommand cmd, QByteArray& out, EdlError& error);
    SaharaResult fail(const EdlError& error);
    SaharaResult current() const;

    bool readChipInfo(EdlError& error);
    void parseSerial(const QByteArray& data);
    void parseHwIdV1V2(const QByteArray& data);
    void parseChipIdV3(const QByteArray& data);

    ITransport* m_transport = nullptr;
    SaharaStateMachine m_machine;
    SaharaDeviceInfo m_deviceInfo;
    QByteArray m_loader;
    QByteArray m_rx;
    QByteArray m_execData;
    qint64 m_served = 0;

    int m_helloTimeoutMs = DEFAULT_HELLO_TIMEOUT_MS;
    int m_packetTimeoutMs = DEFAULT_PACKET_TIMEOUT_MS;

    static constexpr int READ_CHUNK = 4096;
};

} // namespace edlkit
