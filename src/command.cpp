#include "dacwire/command.hpp"   // Command, Frame, builders, codec API

namespace dacwire {
// ============================================================================
// Low-level helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Assemble a frame from its three fields. V goes out big-endian (MSB first),
// which is what the controller firmware reads.
// ---------------------------------------------------------------------------
static inline Frame frame(uint8_t b0, uint8_t b1, uint16_t v) {
    Frame f;
    f[0] = b0;
    f[1] = b1;
    f[2] = static_cast<uint8_t>((v >> 8) & 0xFF);   // MSB
    f[3] = static_cast<uint8_t>(v & 0xFF);          // LSB
    return f;
}

static inline uint16_t be16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

// Decimal append into any ETL string; silently stops at capacity.
static void append_u32(etl::istring& s, uint32_t v) {
    char tmp[10];
    size_t n = 0;
    do {
        tmp[n++] = static_cast<char>('0' + (v % 10));
        v /= 10;
    } while (v && n < sizeof(tmp));
    while (n && !s.full()) s += tmp[--n];
}

static inline bool is_channel(uint8_t c) { return c < DAC_CHANNELS; }
static inline bool is_table(uint8_t t)   { return t < TABLE_COUNT; }
static inline bool is_pin(uint8_t p)     { return p < GPIO_PINS; }


// ============================================================================
// Builders
// ============================================================================

bool make_dac_write(uint8_t channel, uint16_t value, Command& out) {
    if (!is_channel(channel)) return false;
    Command c;
    c.kind    = CommandKind::DacWrite;
    c.channel = channel;
    c.value   = value;
    out = c;
    return true;
}

bool make_attach_table(uint8_t channel, uint8_t table, Command& out) {
    if (!is_channel(channel) || !is_table(table)) return false;
    Command c;
    c.kind    = CommandKind::AttachTable;
    c.channel = channel;
    c.table   = table;
    out = c;
    return true;
}

bool make_table_write(uint8_t table, uint8_t index, uint16_t value, Command& out) {
    if (!is_table(table)) return false;
    Command c;
    c.kind  = CommandKind::TableWrite;
    c.table = table;
    c.index = index;
    c.value = value;
    out = c;
    return true;
}

bool make_gpio_set(uint8_t pin, bool on, Command& out) {
    if (!is_pin(pin)) return false;
    Command c;
    c.kind = CommandKind::GpioSet;
    c.pin  = pin;
    c.on   = on;
    out = c;
    return true;
}

Command make_use_table_offset(uint8_t offset) {
    Command c;
    c.kind  = CommandKind::UseTableOffset;
    c.index = offset;
    return c;
}

Command make_keepalive() {
    Command c;
    c.kind = CommandKind::KeepAlive;
    return c;
}

Command make_ldac() {
    Command c;
    c.kind = CommandKind::Ldac;
    return c;
}

Command make_register_write(uint8_t reg, uint16_t value) {
    Command c;
    c.kind  = CommandKind::RegisterWrite;
    c.reg   = reg;
    c.value = value;
    return c;
}


// ============================================================================
// Codec
// ============================================================================

Frame encode(const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::DacWrite:       return frame(cmd.channel, 0x00, cmd.value);
        case CommandKind::AttachTable:    return frame(cmd.channel, static_cast<uint8_t>(TABLE_BASE + cmd.table), 0x0000);
        case CommandKind::TableWrite:     return frame(static_cast<uint8_t>(TABLE_BASE + cmd.table), cmd.index, cmd.value);
        case CommandKind::UseTableOffset: return frame(OP_USE_TABLE, cmd.index, 0x0000);
        case CommandKind::GpioSet:        return frame(OP_GPIO, cmd.pin, cmd.on ? 0x0001 : 0x0000);
        case CommandKind::KeepAlive:      return frame(OP_KEEPALIVE, 0x00, 0x0000);
        case CommandKind::Ldac:           return frame(OP_LDAC, 0x00, 0x0000);
        case CommandKind::RegisterWrite:  return frame(OP_REGISTER, cmd.reg, cmd.value);
    }
    return frame(OP_KEEPALIVE, 0x00, 0x0000);    // unreachable with a valid kind
}

// ---------------------------------------------------------------------------
// decode()
// --------
// Mirrors the decision table the firmware uses. The first byte picks the
// family; within a DAC channel the second byte separates a direct write
// (0x00) from a table binding (16..19). Anything the table does not name
// is rejected so callers can answer STATUS_ERROR.
// ---------------------------------------------------------------------------
bool decode(const uint8_t* bytes, size_t len, Command& out) {
    if (!bytes || len != FRAME_SIZE) return false;

    const uint8_t  b0 = bytes[0];
    const uint8_t  b1 = bytes[1];
    const uint16_t v  = be16(bytes + 2);

    if (is_channel(b0)) {
        if (b1 == 0x00) return make_dac_write(b0, v, out);
        if (b1 >= TABLE_BASE && b1 < TABLE_BASE + TABLE_COUNT)
            return make_attach_table(b0, static_cast<uint8_t>(b1 - TABLE_BASE), out);
        return false;                                   // unknown DAC sub-command
    }

    if (b0 >= TABLE_BASE && b0 < TABLE_BASE + TABLE_COUNT)
        return make_table_write(static_cast<uint8_t>(b0 - TABLE_BASE), b1, v, out);

    switch (b0) {
        case OP_USE_TABLE: out = make_use_table_offset(b1); return true;
        case OP_GPIO:      return make_gpio_set(b1, v != 0, out);
        case OP_KEEPALIVE: out = make_keepalive();          return true;
        case OP_LDAC:      out = make_ldac();               return true;
        case OP_REGISTER:  out = make_register_write(b1, v); return true;
        default:           return false;
    }
}

uint8_t opcode_of(const Command& cmd) {
    return encode(cmd)[0];
}

const char* kind_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::DacWrite:       return "dac";
        case CommandKind::AttachTable:    return "attach";
        case CommandKind::TableWrite:     return "table";
        case CommandKind::UseTableOffset: return "offset";
        case CommandKind::GpioSet:        return "gpio";
        case CommandKind::KeepAlive:      return "keepalive";
        case CommandKind::Ldac:           return "ldac";
        case CommandKind::RegisterWrite:  return "register";
    }
    return "unknown";
}

CommandLabel describe(const Command& cmd) {
    CommandLabel s;
    switch (cmd.kind) {
        case CommandKind::DacWrite:
            s.append("DAC ");   append_u32(s, cmd.channel);
            s.append(" = ");    append_u32(s, cmd.value);
            break;
        case CommandKind::AttachTable:
            s.append("DAC ");   append_u32(s, cmd.channel);
            s.append(" -> table "); append_u32(s, cmd.table);
            break;
        case CommandKind::TableWrite:
            s.append("table "); append_u32(s, cmd.table);
            s.append("[");      append_u32(s, cmd.index);
            s.append("] = ");   append_u32(s, cmd.value);
            break;
        case CommandKind::UseTableOffset:
            s.append("Table offset = "); append_u32(s, cmd.index);
            break;
        case CommandKind::GpioSet:
            s.append("GPIO ");  append_u32(s, cmd.pin);
            s.append(cmd.on ? " = ON" : " = OFF");
            break;
        case CommandKind::KeepAlive:
            s.append("keepalive");
            break;
        case CommandKind::Ldac:
            s.append("LDAC");
            break;
        case CommandKind::RegisterWrite:
            s.append("register "); append_u32(s, cmd.reg);
            s.append(" = ");       append_u32(s, cmd.value);
            break;
    }
    return s;
}


// ============================================================================
// Responses
// ============================================================================

ResponseView classify_response(const uint8_t* data, size_t len, size_t expected) {
    ResponseView r;
    r.count = data ? len : 0;

    if (r.count == 0)             r.kind = ResponseKind::Empty;
    else if (r.count < expected)  r.kind = ResponseKind::Partial;
    else                          r.kind = ResponseKind::Bytes;

    if (r.count >= STATUS_REPLY_SIZE) {
        r.has_status = true;
        r.status     = be16(data);
    }
    return r;
}

const char* response_kind_name(ResponseKind kind) {
    switch (kind) {
        case ResponseKind::Empty:   return "Empty";
        case ResponseKind::Partial: return "Partial";
        case ResponseKind::Bytes:   return "Bytes";
    }
    return "Empty";
}

size_t reply_length_from_header(const uint8_t* data, size_t len) {
    if (!data || len < 2) return STATUS_REPLY_SIZE;
    if (data[0] == 0x01) return STATUS_REPLY_SIZE + data[1];   // extended: [0x01, n, payload...]
    return STATUS_REPLY_SIZE;                                   // standard or unknown header
}

} // namespace dacwire
