#include "usb_transport.h"
#include "core/logger.h"

#include <libusb-1.0/libusb.h>

static const QString TAG = QStringLiteral("USB");

namespace edlkit {

UsbTransport::UsbTransport(uint16_t vid, uint16_t pid, int interfaceNumber)
    : m_vid(vid), m_pid(pid), m_interface(interfaceNumber)
{
}

UsbTransport::~UsbTransport()
{
    close();
}

bool UsbTransport::open()
{
    QMutexLocker lock(&m_mutex);
    if (m_handle)
        return true;

    int ret = libusb_init(&m_context);
    if (ret != 0) {
        LOG_ERROR_CAT(TAG, QString("libusb_init failed: %1")
                               .arg(libusb_strerror(static_cast<libusb_error>(ret))));
        m_context = nullptr;
        m_status = TransportStatus::IoError;
        return false;
    }

    m_handle = libusb_open_device_with_vid_pid(m_context, m_vid, m_pid);
    if (!m_handle) {
        LOG_ERROR_CAT(TAG, QString("No USB device with VID=%1 PID=%2")
                               .arg(m_vid, 4, 16, QChar('0')).arg(m_pid, 4, 16, QChar('0')));
        libusb_exit(m_context);
        m_context = nullptr;
        m_status = TransportStatus::Closed;
        return false;
    }

    if (!claimInterface() || !findEndpoints()) {
        if (m_handle) {
            libusb_close(m_handle);
            m_handle = nullptr;
        }
        libusb_exit(m_context);
        m_context = nullptr;
        m_status = TransportStatus::IoError;
        return false;
    }

    m_status = TransportStatus::Ok;
    LOG_INFO_CAT(TAG, QString("Opened %1 (in=0x%2 out=0x%3 maxPacket=%4)")
                          .arg(description())
                          .arg(m_epIn, 2, 16, QChar('0'))
                          .arg(m_epOut, 2, 16, QChar('0'))
                          .arg(m_maxPacketOut));
    return true;
}

void UsbTransport::close()
{
    QMutexLocker lock(&m_mutex);
    if (m_handle) {
        libusb_release_interface(m_handle, m_interface);
        if (m_kernelDriverDetached)
            libusb_attach_kernel_driver(m_handle, m_interface);
        libusb_close(m_handle);
        m_handle = nullptr;
        m_kernelDriverDetached = false;
        LOG_INFO_CAT(TAG, "Closed " + description());
    }
    if (m_context) {
        libusb_exit(m_context);
        m_context = nullptr;
    }
    m_status = TransportStatus::Closed;
}

bool UsbTransport::isOpen() const
{
    return m_handle != nullptr;
}

void UsbTransport::setStatusFromLibusb(int ret)
{
    switch (ret) {
    case LIBUSB_SUCCESS:
        m_status = TransportStatus::Ok;
        break;
    case LIBUSB_ERROR_TIMEOUT:
        m_status = TransportStatus::Timeout;
        break;
    case LIBUSB_ERROR_NO_DEVICE:
    case LIBUSB_ERROR_NOT_FOUND:
        m_status = TransportStatus::Closed;
        break;
    default:
        m_status = TransportStatus::IoError;
        break;
    }
}

QByteArray UsbTransport::read(int maxSize, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_handle) {
        m_status = TransportStatus::Closed;
        return {};
    }

    QByteArray buffer(maxSize, '\0');
    int transferred = 0;
    int ret = libusb_bulk_transfer(m_handle, m_epIn,
                                   reinterpret_cast<unsigned char*>(buffer.data()),
                                   maxSize, &transferred, static_cast<unsigned int>(timeoutMs));
    // A timed-out transfer may still have delivered bytes
    if (ret == LIBUSB_ERROR_TIMEOUT && transferred > 0)
        ret = LIBUSB_SUCCESS;
    setStatusFromLibusb(ret);

    if (ret != LIBUSB_SUCCESS) {
        if (ret != LIBUSB_ERROR_TIMEOUT) {
            LOG_ERROR_CAT(TAG, QString("Bulk read failed: %1")
                                   .arg(libusb_strerror(static_cast<libusb_error>(ret))));
        }
        return {};
    }
    buffer.resize(transferred);
    return buffer;
}

qint64 UsbTransport::write(const QByteArray& data, int timeoutMs)
{
    QMutexLocker lock(&m_mutex);
    if (!m_handle) {
        m_status = TransportStatus::Closed;
        return -1;
    }

    int transferred = 0;
    int ret = libusb_bulk_transfer(m_handle, m_epOut,
                                   reinterpret_cast<unsigned char*>(const_cast<char*>(data.constData())),
                                   data.size(), &transferred, static_cast<unsigned int>(timeoutMs));
    setStatusFromLibusb(ret);
    if (ret != LIBUSB_SUCCESS) {
        LOG_ERROR_CAT(TAG, QString("Bulk write failed after %1/%2 bytes: %3")
                               .arg(transferred).arg(data.size())
                               .arg(libusb_strerror(static_cast<libusb_error>(ret))));
        return transferred > 0 ? transferred : -1;
    }

    // The loader only sees the end of a transfer on a short packet
    if (!data.isEmpty() && m_maxPacketOut > 0 && data.size() % m_maxPacketOut == 0) {
        int zlp = 0;
        ret = libusb_bulk_transfer(m_handle, m_epOut, nullptr, 0, &zlp,
                                   static_cast<unsigned int>(timeoutMs));
        if (ret != LIBUSB_SUCCESS) {
            setStatusFromLibusb(ret);
            LOG_ERROR_CAT(TAG, QString("Zero-length packet failed: %1")
                                   .arg(libusb_strerror(static_cast<libusb_error>(ret))));
            return -1;
        }
    }
    return transferred;
}

QString UsbTransport::description() const
{
    return QString("USB[%1:%2]").arg(m_vid, 4, 16, QChar('0')).arg(m_pid, 4, 16, QChar('0'));
}

bool UsbTransport::claimInterface()
{
    if (libusb_kernel_driver_active(m_handle, m_interface) == 1) {
        int ret = libusb_detach_kernel_driver(m_handle, m_interface);
        if (ret != 0) {
            LOG_ERROR_CAT(TAG, QString("Cannot detach kernel driver: %1")
                                   .arg(libusb_strerror(static_cast<libusb_error>(ret))));
            return false;
        }
        m_kernelDriverDetached = true;
    }

    int ret = libusb_claim_interface(m_handle, m_interface);
    if (ret != 0) {
        LOG_ERROR_CAT(TAG, QString("Failed to claim interface %1: %2")
                               .arg(m_interface)
                               .arg(libusb_strerror(static_cast<libusb_error>(ret))));
        return false;
    }
    return true;
}

bool UsbTransport::findEndpoints()
{
    libusb_device* dev = libusb_get_device(m_handle);
    libusb_config_descriptor* config = nullptr;
    if (libusb_get_active_config_descriptor(dev, &config) != 0)
        return false;

    bool foundIn = false, foundOut = false;
    if (m_interface < config->bNumInterfaces) {
        const libusb_interface& iface = config->interface[m_interface];
        for (int j = 0; j < iface.num_altsetting && !(foundIn && foundOut); j++) {
            const libusb_interface_descriptor& alt = iface.altsetting[j];
            for (int k = 0; k < alt.bNumEndpoints; k++) {
                const libusb_endpoint_descriptor& ep = alt.endpoint[k];
                if ((ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK)
                    continue;
                if (ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) {
                    m_epIn = ep.bEndpointAddress;
                    foundIn = true;
                } else {
                    m_epOut = ep.bEndpointAddress;
                    m_maxPacketOut = ep.wMaxPacketSize;
                    foundOut = true;
                }
            }
        }
    }

    libusb_free_config_descriptor(config);
    if (!(foundIn && foundOut))
        LOG_ERROR_CAT(TAG, QString("Interface %1 has no bulk endpoint pair").arg(m_interface));
    return foundIn && foundOut;
}

} // namespace edlkit
