#include "dacwire/device_model.hpp"

namespace dacwire {

DeviceModel::DeviceModel() {
    dac_.fill(0);
    gpio_.fill(false);
    binding_.fill(NO_TABLE);
    for (auto& t : tables_) t.fill(0);
    registers_.fill(0);
}

uint16_t DeviceModel::apply(const uint8_t* frame, size_t len) {
    Command cmd;
    if (!decode(frame, len, cmd)) {
        ++frames_error_;
        return STATUS_ERROR;
    }
    return apply(cmd);
}

uint16_t DeviceModel::apply(const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::DacWrite:
            dac_[cmd.channel] = cmd.value;
            break;
        case CommandKind::AttachTable:
            binding_[cmd.channel] = cmd.table;
            break;
        case CommandKind::TableWrite:
            tables_[cmd.table][cmd.index] = cmd.value;
            break;
        case CommandKind::UseTableOffset:
            table_offset_ = cmd.index;
            break;
        case CommandKind::GpioSet:
            gpio_[cmd.pin] = cmd.on;
            break;
        case CommandKind::KeepAlive:
            ++keepalives_;
            break;
        case CommandKind::Ldac:
            ++ldac_count_;
            break;
        case CommandKind::RegisterWrite:
            registers_[cmd.reg] = cmd.value;
            break;
    }
    last_ = cmd;
    ++frames_ok_;
    return STATUS_OK;
}

void DeviceModel::status_bytes(uint16_t status, uint8_t out[STATUS_REPLY_SIZE]) {
    out[0] = static_cast<uint8_t>((status >> 8) & 0xFF);
    out[1] = static_cast<uint8_t>(status & 0xFF);
}

} // namespace dacwire
