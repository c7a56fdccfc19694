#pragma once
/**
 * @page dw-device-model dacwire Device Model
 * @file device_model.hpp
 * @brief Software stand-in for the controller: accepts frames, mirrors documented state,
 *        answers with a status word.
 *
 * @details
 * PURPOSE
 * -------
 * The simulator tool and the session tests need something that behaves like the device at
 * the wire level without modelling its analog side. DeviceModel decodes each 4-byte frame,
 * applies the documented effect to a mirror of the registers, and returns STATUS_OK or
 * STATUS_ERROR. Nothing else is assumed: table lookups are stored but not evaluated, LDAC
 * and register writes are only counted.
 *
 * FrameAssembler (below) cuts an arbitrary byte stream back into 4-byte frames, because a
 * TCP read may deliver half a frame or several at once.
 *
 * EXAMPLE
 * -------
 * @code
 *   dacwire::DeviceModel dev;
 *   dacwire::FrameAssembler fa;
 *   for (size_t i = 0; i < n; ++i) {
 *       if (fa.push(buf[i])) {
 *           uint16_t status = dev.apply(fa.frame().data(), dacwire::FRAME_SIZE);
 *           // send status big-endian
 *       }
 *   }
 * @endcode
 */

#include <stdint.h>
#include <stddef.h>
#include "etl/array.h"
#include "dacwire/command.hpp"

namespace dacwire {

/// Sentinel for "channel not bound to any table".
static constexpr uint8_t NO_TABLE = 0xFF;

class DeviceModel {
public:
    using Table = etl::array<uint16_t, 256>;

    DeviceModel();

    /**
     * @brief Decode and apply one frame.
     * @return STATUS_OK when the frame decodes, STATUS_ERROR otherwise (state unchanged).
     */
    uint16_t apply(const uint8_t* frame, size_t len);

    /// Apply an already-decoded command. Always STATUS_OK.
    uint16_t apply(const Command& cmd);

    /// Writes the 2-byte big-endian reply for @p status into @p out.
    static void status_bytes(uint16_t status, uint8_t out[STATUS_REPLY_SIZE]);

    uint16_t dac(uint8_t ch) const            { return dac_[ch % DAC_CHANNELS]; }
    bool     gpio(uint8_t pin) const          { return gpio_[pin % GPIO_PINS]; }
    uint8_t  binding(uint8_t ch) const        { return binding_[ch % DAC_CHANNELS]; }
    uint16_t table(uint8_t t, uint8_t i) const { return tables_[t % TABLE_COUNT][i]; }
    uint8_t  table_offset() const             { return table_offset_; }
    uint16_t reg(uint8_t r) const             { return registers_[r]; }

    uint32_t keepalives() const   { return keepalives_; }
    uint32_t ldac_count() const   { return ldac_count_; }
    uint32_t frames_ok() const    { return frames_ok_; }
    uint32_t frames_error() const { return frames_error_; }

    /// Last successfully applied command.
    const Command& last() const { return last_; }

private:
    etl::array<uint16_t, DAC_CHANNELS> dac_;
    etl::array<bool, GPIO_PINS>        gpio_;
    etl::array<uint8_t, DAC_CHANNELS>  binding_;
    etl::array<Table, TABLE_COUNT>     tables_;
    etl::array<uint16_t, 256>          registers_;
    uint8_t  table_offset_{0};
    uint32_t keepalives_{0};
    uint32_t ldac_count_{0};
    uint32_t frames_ok_{0};
    uint32_t frames_error_{0};
    Command  last_;
};

/**
 * @class FrameAssembler
 * @brief Accumulates stream bytes and yields complete 4-byte frames.
 */
class FrameAssembler {
public:
    /// Feed one byte. Returns true when it completed a frame, now available via frame().
    bool push(uint8_t b) {
        buf_[fill_++] = b;
        if (fill_ < FRAME_SIZE) return false;
        fill_ = 0;
        return true;
    }

    const Frame& frame() const { return buf_; }
    size_t pending() const     { return fill_; }
    void clear()               { fill_ = 0; }

private:
    Frame  buf_{};
    size_t fill_{0};
};

} // namespace dacwire
