#pragma once
/**
 * @page dw-script dacwire Scripted Sequences
 * @file script.hpp
 * @brief Canned command sequences used by the sweep and demo tools.
 *
 * @details
 * PURPOSE
 * -------
 * The scripted tools do not hand-craft frames. They ask this module for a list of Commands
 * (an etl::ivector so the caller picks the capacity) and feed it to a Session one frame at a
 * time. Keeping the sequences here means they are testable without a device and the tools
 * only own pacing and printing.
 *
 * SEQUENCES
 * ---------
 * - Init sequence (sweep tool): GPIO0/1 on, table 0 and table 1 seeded at entries 49..51,
 *   even channels bound to table 0 and odd channels to table 1, three keepalives.
 * - Demo sequence pieces: direct values, channel pairs bound 0,1 / 4,5 to table 0 and
 *   2,3 / 6,7 to table 1, ascending and descending table fills, RS-422 speed registers.
 * - SweepGenerator: endless stream of DAC writes walking all channels while the value climbs
 *   by 511 with the same clamp-then-wrap rule as the panel's large step.
 *
 * All builders append to @p out and return false when it runs out of room (what was
 * appended stays).
 */

#include <stdint.h>
#include "etl/vector.h"
#include "dacwire/command.hpp"

namespace dacwire {

static constexpr uint16_t SWEEP_STEP        = 511;
static constexpr uint8_t  INIT_TABLE_FIRST  = 49;     ///< first entry seeded by the init sequence
static constexpr uint8_t  INIT_KEEPALIVES   = 3;
static constexpr uint8_t  DEMO_OFFSET_BASE  = 48;     ///< ASCII '0'
static constexpr uint8_t  DEMO_TABLE_LEN    = 10;
static constexpr uint16_t DEMO_TABLE_STEP   = 0x3FFF;
static constexpr uint32_t DEMO_RS422_SPEED  = 2000000;
static constexpr uint8_t  RS422_REG_HIGH    = 1;
static constexpr uint8_t  RS422_REG_LOW     = 2;

/// GpioSet(pin, on=true) for pins 0 and 1.
bool build_gpio_enable(etl::ivector<Command>& out);

/// Table 0 entries 49..51 = 0x0000/0x4000/0x8000; table 1 entries 49..51 = 0x4000/0x8000/0x0000.
bool build_init_tables(etl::ivector<Command>& out);

/// AttachTable(ch, ch % 2) for every channel.
bool build_bind_channels(etl::ivector<Command>& out);

/// GPIO enable, init tables, channel binding, then INIT_KEEPALIVES keepalives.
bool build_init_sequence(etl::ivector<Command>& out);

/// DacWrite(ch, value) for every channel.
bool build_all_channels(uint16_t value, etl::ivector<Command>& out);

/// Channels 0,1 -> table 0; 2,3 -> table 1; 4,5 -> table 0; 6,7 -> table 1.
bool build_demo_bindings(etl::ivector<Command>& out);

/**
 * @brief Fill @p count entries of @p table starting at @p first_index.
 *
 * Ascending fills start at 0 and add @p step; descending fills start at 0xFFFF and subtract
 * it. Both wrap modulo 2^16. Fails without appending when the index range passes 255 or the
 * table number is out of range.
 */
bool build_table_fill(uint8_t table, uint8_t first_index, uint8_t count, uint16_t step,
                      bool ascending, etl::ivector<Command>& out);

/// RegisterWrite(1, speed >> 16) then RegisterWrite(2, speed & 0xFFFF).
bool build_rs422_config(uint32_t speed, etl::ivector<Command>& out);

/**
 * @class SweepGenerator
 * @brief Produces the sweep tool's DAC writes one at a time.
 *
 * The channel advances first (1, 2, ..., 7, 0, 1, ...), then the value moves by 511 with
 * clamp-then-wrap. Channels 0..3 carry v, channels 4..7 carry 65535 - v.
 */
class SweepGenerator {
public:
    SweepGenerator() = default;

    Command next();

    uint8_t  channel() const { return channel_; }
    uint16_t value() const { return value_; }
    uint32_t count() const { return count_; }

private:
    uint8_t  channel_{0};
    uint16_t value_{0};
    uint32_t count_{0};
};

} // namespace dacwire
