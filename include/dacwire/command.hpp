#pragma once
/**
 * @page dw-command dacwire Command Codec
 * @file command.hpp
 * @brief Fixed 4-byte command frames for the DAC/GPIO controller: builders, encode, decode,
 *        and response classification.
 *
 * @details
 * PURPOSE
 * -------
 * This is the *contract* between a host and the DAC/GPIO controller. Every operation the
 * device understands is one 4-byte frame. There is no length prefix, no checksum and no
 * delimiter; the fixed frame size is the framing. Serial and TCP links carry the same bytes,
 * so one encoder and one decoder serve both transports.
 *
 * WIRE LAYOUT
 * -----------
 *   +------------+--------------+-------------------+-----------------------------------+
 *   | B0         | B1           | B2..B3 (V, BE)    | Meaning                           |
 *   +------------+--------------+-------------------+-----------------------------------+
 *   | n = 0..7   | 0x00         | value             | direct write DAC(n) = value       |
 *   | n = 0..7   | 16..19       | 0x0000            | bind DAC(n) to table (B1 - 16)    |
 *   | 16..19     | i = 0..255   | value             | table(B0 - 16)[i] = value         |
 *   | 0xFF       | offset       | 0x0000            | select table offset               |
 *   | 0xFE       | n = 0..7     | 0x0000 / 0x0001   | set GPIO(n) off / on              |
 *   | 0xFD       | 0x00         | 0x0000            | keepalive                         |
 *   | 0xFC       | 0x00         | 0x0000            | LDAC (latch loaded DAC values)    |
 *   | 0xFB       | register     | value             | register write (optional variant) |
 *   +------------+--------------+-------------------+-----------------------------------+
 *
 * The device answers each frame with a 2-byte big-endian status word (0x0000 ok,
 * 0xFFFF error). The codec does not insist on that: a response is "whatever bytes arrived
 * within the read timeout". classify_response() only says Empty / Partial / Bytes and, when
 * two or more bytes are present, exposes the first status word.
 *
 * CONSTRUCTION RULES
 * ------------------
 * - A Command is only ever produced by a make_*() builder (or decode()). Builders refuse
 *   out-of-range arguments by returning false, so an out-of-range value never reaches encode().
 * - Builders zero the fields a variant does not use. Two Commands compare equal when they
 *   encode to the same frame.
 *
 * EXAMPLE
 * -------
 * @code
 *   dacwire::Command c;
 *   if (dacwire::make_dac_write(3, 0x1000, c)) {
 *       dacwire::Frame f = dacwire::encode(c);   // 03 00 10 00
 *   }
 * @endcode
 *
 * This header is part of the portable core: ETL containers only, no heap, no exceptions.
 */

#include <stdint.h>
#include <stddef.h>
#include "etl/array.h"
#include "etl/string.h"

namespace dacwire {

// ============================== Geometry ==============================
static constexpr size_t  FRAME_SIZE   = 4;   ///< Every command frame is exactly this many bytes.
static constexpr uint8_t DAC_CHANNELS = 8;   ///< DAC channels 0..7.
static constexpr uint8_t GPIO_PINS    = 8;   ///< GPIO pins 0..7.
static constexpr uint8_t TABLE_COUNT  = 4;   ///< Lookup tables 0..3.
static constexpr uint8_t TABLE_BASE   = 16;  ///< Table n is addressed as 16 + n on the wire.

// ============================== Opcodes ===============================
/**
 * @name Special first bytes
 * Values of B0 that are not a DAC channel or a table number.
 */
enum : uint8_t {
    OP_USE_TABLE = 0xFF,  /**< B1 = table offset. */
    OP_GPIO      = 0xFE,  /**< B1 = pin, V = 0 or 1. */
    OP_KEEPALIVE = 0xFD,  /**< Resets the device's idle timer (GPIO0 enable line). */
    OP_LDAC      = 0xFC,  /**< Latch all loaded DAC registers at once. */
    OP_REGISTER  = 0xFB   /**< B1 = register number, V = value. Only documented in some variants. */
};

// ============================== Replies ===============================
static constexpr size_t   STATUS_REPLY_SIZE = 2;       ///< Bytes the device returns per frame.
static constexpr uint16_t STATUS_OK         = 0x0000;
static constexpr uint16_t STATUS_ERROR      = 0xFFFF;

/// One encoded command, always FRAME_SIZE bytes.
using Frame = etl::array<uint8_t, FRAME_SIZE>;

/// Short human-readable rendering of a command, e.g. "DAC 3 = 4096".
using CommandLabel = etl::string<48>;

/**
 * @enum CommandKind
 * @brief Which of the protocol operations a Command carries.
 */
enum class CommandKind : uint8_t {
    DacWrite,        ///< channel, value
    AttachTable,     ///< channel, table
    TableWrite,      ///< table, index, value
    UseTableOffset,  ///< index (the offset)
    GpioSet,         ///< pin, on
    KeepAlive,
    Ldac,
    RegisterWrite    ///< reg, value
};

/**
 * @struct Command
 * @brief Tagged value for one protocol operation.
 *
 * Only the fields listed for the kind are meaningful; the builders leave the rest at zero.
 * Build one with the make_*() functions below rather than filling fields by hand.
 */
struct Command {
    CommandKind kind{CommandKind::KeepAlive};
    uint8_t  channel{0};  ///< DAC channel (DacWrite, AttachTable)
    uint8_t  table{0};    ///< table number 0..3 (AttachTable, TableWrite)
    uint8_t  index{0};    ///< table entry (TableWrite) or table offset (UseTableOffset)
    uint8_t  pin{0};      ///< GPIO pin (GpioSet)
    uint8_t  reg{0};      ///< register number (RegisterWrite)
    bool     on{false};   ///< GPIO state (GpioSet)
    uint16_t value{0};    ///< 16-bit payload (DacWrite, TableWrite, RegisterWrite)

    bool operator==(const Command& o) const {
        return kind == o.kind && channel == o.channel && table == o.table &&
               index == o.index && pin == o.pin && reg == o.reg &&
               on == o.on && value == o.value;
    }
    bool operator!=(const Command& o) const { return !(*this == o); }
};

// ============================== Builders ==============================
// Range-checked builders. On a range violation they return false and leave `out` untouched.

bool make_dac_write(uint8_t channel, uint16_t value, Command& out);
bool make_attach_table(uint8_t channel, uint8_t table, Command& out);
bool make_table_write(uint8_t table, uint8_t index, uint16_t value, Command& out);
bool make_gpio_set(uint8_t pin, bool on, Command& out);

// Total builders: every argument value is valid on the wire.
Command make_use_table_offset(uint8_t offset);
Command make_keepalive();
Command make_ldac();
Command make_register_write(uint8_t reg, uint16_t value);

// ============================== Codec =================================

/**
 * @brief Serialize a Command into its 4-byte frame.
 *
 * Pure and total over Commands produced by the builders. Variants whose natural payload is
 * shorter than four bytes are zero-padded.
 */
Frame encode(const Command& cmd);

/**
 * @brief Parse a 4-byte frame back into a Command.
 *
 * @param bytes  frame bytes
 * @param len    must be FRAME_SIZE
 * @param out    receives the command on success
 * @return false for a wrong length, an unknown first byte, or an out-of-range field.
 *
 * Fields the device ignores (the V word of bind/offset/keepalive/LDAC, B1 of keepalive/LDAC)
 * are not checked. A GPIO V word other than zero means "on".
 */
bool decode(const uint8_t* bytes, size_t len, Command& out);

/// Opcode byte (B0) a Command will be sent with; used for response filters.
uint8_t opcode_of(const Command& cmd);

/// Stable lowercase name of a kind ("dac", "attach", "table", "offset", "gpio", ...).
const char* kind_name(CommandKind kind);

/// "DAC 3 = 4096", "GPIO 1 = ON", "table 0[49] = 16384", "keepalive", ...
CommandLabel describe(const Command& cmd);

// ============================== Responses =============================

/**
 * @enum ResponseKind
 * @brief What a single bounded read produced.
 */
enum class ResponseKind : uint8_t {
    Empty,    ///< nothing arrived before the read timeout
    Partial,  ///< fewer bytes than expected
    Bytes     ///< at least the expected number of bytes
};

/**
 * @struct ResponseView
 * @brief Classification of response bytes; the content itself stays opaque.
 */
struct ResponseView {
    ResponseKind kind{ResponseKind::Empty};
    size_t   count{0};        ///< bytes observed
    bool     has_status{false};
    uint16_t status{0};       ///< first big-endian word when count >= 2

    bool status_ok() const { return has_status && status == STATUS_OK; }
};

/**
 * @brief Classify bytes read after a frame was sent.
 * @param expected  reply length the caller is waiting for (STATUS_REPLY_SIZE per frame).
 */
ResponseView classify_response(const uint8_t* data, size_t len,
                               size_t expected = STATUS_REPLY_SIZE);

/// "Empty", "Partial", "Bytes".
const char* response_kind_name(ResponseKind kind);

/**
 * @brief Total reply length announced by a reply header.
 *
 * Standard replies are `[0x00, status]` (2 bytes). Extended replies are
 * `[0x01, n, payload...]` (2 + n bytes). Anything else, or a header that has not fully
 * arrived yet, is treated as a standard 2-byte reply.
 */
size_t reply_length_from_header(const uint8_t* data, size_t len);

} // namespace dacwire
