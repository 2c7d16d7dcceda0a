#pragma once

#include <cstdint>
#include <cstddef>
#include <QByteArray>

namespace edlkit {

// CRC-32 (IEEE 802.3, reflected, as used by GPT headers and entry arrays)
class Crc32 {
public:
    static uint32_t compute(const uint8_t* data, size_t length);
    static uint32_t compute(const QByteArray& data);
    static uint32_t update(uint32_t crc, const uint8_t* data, size_t length);
};

} // namespace edlkit
