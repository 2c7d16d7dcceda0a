#include "serial_transport.h"
#include "core/logger.h"

static const QString TAG = QStringLiteral("Serial");

namespace edlkit {

SerialTransport::SerialTransport(const QString& portName, qint32 baudRate)
    : m_portName(portName), m_baudRate(baudRate)
{
}

SerialTransport::~SerialTransport()
{
    close();
}

bool SerialTransport::open()
{
    QMutexLocker lock(&m_mutex);
    m_port = std::make_unique<QSerialPort>();
    m_port->setPortName(m_portName);
    m_port->setBaudRate(m_baudRate);
    m_port->setDataBits(QSerialPort::Data8);
    m_port->setParity(QSerialPort::NoParity);
    m_port->setStopBits(QSerialPort::OneStop);
    m_port->setFlowControl(QSerialPort::NoFlowControl);

    if (!m_port->open(QIODevice::ReadWrite)) {
        LOG_ERROR_CAT(TAG, QString("Failed to open %1: %2").arg(m_portName, m_port->errorString()));
        m_port.reset();
        m_status = TransportStatus::Closed;
        return false;
    }

    m_port->setReadBufferSize(1024 * 1024);
    m_status = TransportStatus::Ok;
    LOG_INFO_CAT(TAG, QString("Opened %1 @ %2 baud").arg(m_portName).arg(m_baudRate));
    return true;
}

void SerialTransport::close()
{
    QMutexLocker lock(&m_mutex);
    if (m_port && m_port->isOpen()) {
        m_port->close();
        LOG_INFO_CAT(TAG, "Closed " + m_portName);
    }
    m_port.reset();
    m_status = TransportStatus::Closed;
}

bool SerialTransport::isOpen() const
{
    return m_port && m_port->isOpen();
}

void SerialTransport::setStatusFromPort()
{
    switch (m_port->error()) {
    case QSerialPort::NoError:
        m_status = TransportStatus::Ok;
        break;
    case QSerialPort::TimeoutError:
        m_status = TransportStatus::Timeout;
        break;
    case QSerialPort::ResourceError:
    case QSerialPort::DeviceNotFoundError:
    case QSerialPort::NotOpenError:
        m_status = TransportStatus::Closed;
        break;
    default:
        m_status = TransportStatus::IoError;
        break;
    }
}

QByteArray SerialTransport::read(int maxSize, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_port || !m_port->isOpen()) {
        m_status = TransportStatus::Closed;
        return {};
    }

    m_port->clearError();
    if (m_port->bytesAvailable() == 0 && !m_port->waitForReadyRead(timeoutMs)) {
        setStatusFromPort();
        if (m_status == TransportStatus::Ok)
            m_status = TransportStatus::Timeout;
        return {};
    }

    QByteArray data = m_port->read(maxSize);
    setStatusFromPort();
    return data;
}

qint64 SerialTransport::write(const QByteArray& data, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_port || !m_port->isOpen()) {
        m_status = TransportStatus::Closed;
        return -1;
    }

    m_port->clearError();
    qint64 written = m_port->write(data);
    if (written < 0) {
        setStatusFromPort();
        LOG_ERROR_CAT(TAG, QString("Write to %1 failed: %2").arg(m_portName, m_port->errorString()));
        return -1;
    }

    while (m_port->bytesToWrite() > 0) {
        if (!m_port->waitForBytesWritten(timeoutMs)) {
            setStatusFromPort();
            if (m_status == TransportStatus::Ok)
                m_status = TransportStatus::Timeout;
            return written - m_port->bytesToWrite();
        }
    }

    m_status = TransportStatus::Ok;
    return written;
}

QString SerialTransport::description() const
{
    return QString("Serial[%1@%2]").arg(m_portName).arg(m_baudRate);
}

} // namespace edlkit
