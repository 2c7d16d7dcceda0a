#pragma once

#include "i_transport.h"
#include <QSerialPort>
#include <QMutex>
#include <memory>

namespace edlkit {

class SerialTransport : public ITransport {
public:
    explicit SerialTransport(const QString& portName, qint32 baudRate = 115200);
    ~SerialTransport() override;

    bool open() override;
    void close() override;
    bool isOpen() const override;

    QByteArray read(int maxSize, int timeoutMs) override;
    qint64 write(const QByteArray& data, int timeoutMs) override;

    TransportStatus status() const override { return m_status; }
    TransportType type() const override { return TransportType::Serial; }
    QString description() const override;

    QString portName() const { return m_portName; }

private:
    void setStatusFromPort();

    QString m_portName;
    qint32 m_baudRate;
    std::unique_ptr<QSerialPort> m_port;
    TransportStatus m_status = TransportStatus::Closed;
    QMutex m_mutex;
};

} // namespace edlkit
