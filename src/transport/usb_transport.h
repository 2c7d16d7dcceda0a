#pragma once

#include "i_transport.h"
#include <QMutex>
#include <cstdint>

struct libusb_context;
struct libusb_device_handle;

namespace edlkit {

// libusb bulk transport for a device already identified by VID/PID.
class UsbTransport : public ITransport {
public:
    static constexpr uint16_t QUALCOMM_VID = 0x05C6;
    static constexpr uint16_t QUALCOMM_EDL_PID = 0x9008;

    explicit UsbTransport(uint16_t vid = QUALCOMM_VID, uint16_t pid = QUALCOMM_EDL_PID,
                          int interfaceNumber = 0);
    ~UsbTransport() override;

    UsbTransport(const UsbTransport&) = delete;
    UsbTransport& operator=(const UsbTransport&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override;

    QByteArray read(int maxSize, int timeoutMs) override;
    qint64 write(const QByteArray& data, int timeoutMs) override;

    TransportStatus status() const override { return m_status; }
    TransportType type() const override { return TransportType::USB; }
    QString description() const override;

    uint8_t inEndpoint() const { return m_epIn; }
    uint8_t outEndpoint() const { return m_epOut; }

private:
    bool claimInterface();
    bool findEndpoints();
    void setStatusFromLibusb(int ret);

    uint16_t m_vid = 0;
    uint16_t m_pid = 0;
    int m_interface = 0;
    uint8_t m_epIn = 0x81;
    uint8_t m_epOut = 0x01;
    uint16_t m_maxPacketOut = 512;
    bool m_kernelDriverDetached = false;
    TransportStatus m_status = TransportStatus::Closed;

    libusb_context* m_context = nullptr;
    libusb_device_handle* m_handle = nullptr;
    QMutex m_mutex;
};

} // namespace edlkit
