#pragma once
// tests/fake_transport.hpp
// In-memory ITransport for Session tests. Writes are recorded; each send()/recv() consumes
// the next scripted step, or falls back to the default (full write / nothing to read).

#include <cstring>
#include <deque>
#include <vector>

#include "dacwire/device_model.hpp"
#include "dacwire/transport/transport_base.hpp"

namespace dacwire::test {

struct TxStep {
    transport::TxResult result{transport::TxResult::Ok};
    std::size_t         written{FRAME_SIZE};
    int                 err{0};
};

struct RxStep {
    transport::RxResult  result{transport::RxResult::Ok};
    std::vector<uint8_t> bytes;
    int                  err{0};
};

class FakeTransport : public transport::ITransport {
public:
    // Shared with the test after the Session takes ownership of the transport.
    struct Log {
        std::vector<std::vector<uint8_t>> writes;
        std::size_t recv_calls{0};
        std::size_t end_calls{0};
    };

    explicit FakeTransport(Log& log, transport::Kind kind = transport::Kind::Tcp)
    : log_(log), kind_(kind) {}

    std::deque<TxStep> tx_script;
    std::deque<RxStep> rx_script;

    /// When set and rx_script is empty, every read is answered by this model.
    DeviceModel* device{nullptr};

    bool begin(const transport::Config&) override { open_ = true; return true; }
    void end() override {
        if (open_) ++log_.end_calls;
        open_ = false;
    }
    bool is_open() const override { return open_; }

    transport::TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) override {
        TxStep step;
        step.written = len;
        if (!tx_script.empty()) { step = tx_script.front(); tx_script.pop_front(); }

        written = step.written < len ? step.written : len;
        if (step.result != transport::TxResult::Error)
            log_.writes.emplace_back(data, data + written);
        last_frame_.assign(data, data + len);
        errno_ = step.err;
        return step.result;
    }

    transport::RxResult recv(uint8_t* out, std::size_t cap, std::size_t, std::size_t& out_len) override {
        ++log_.recv_calls;
        out_len = 0;

        RxStep step;
        step.result = transport::RxResult::None;
        if (!rx_script.empty()) {
            step = rx_script.front();
            rx_script.pop_front();
        } else if (device) {
            uint8_t sb[STATUS_REPLY_SIZE];
            DeviceModel::status_bytes(device->apply(last_frame_.data(), last_frame_.size()), sb);
            step.result = transport::RxResult::Ok;
            step.bytes.assign(sb, sb + STATUS_REPLY_SIZE);
        }

        out_len = step.bytes.size() < cap ? step.bytes.size() : cap;
        if (out_len) std::memcpy(out, step.bytes.data(), out_len);
        errno_ = step.err;
        return step.result;
    }

    transport::Kind kind() const override { return kind_; }
    const char* name() const override { return "fake"; }
    int last_errno() const override { return errno_; }

private:
    Log&                 log_;
    transport::Kind      kind_;
    bool                 open_{true};
    int                  errno_{0};
    std::vector<uint8_t> last_frame_;
};

} // namespace dacwire::test
