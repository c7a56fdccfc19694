#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios via serial_io; non-blocking).
 *
 * Depends on: serial_io.hpp for open/configure, fd_io.hpp for bounded I/O.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "dacwire/transport/transport_base.hpp"
#include "serial_io.hpp"
#include "fd_io.hpp"
#include <cerrno>
#include <string>

namespace dacwire::transport {

struct SerialConfig : public Config {
  std::string path;   // e.g. /dev/serial/by-id/usb-...
  int baud{DEFAULT_BAUD};
  int boot_delay_ms{0};
};

class LinuxSerial : public ITransport {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin(const Config& cfg) override {
    // Only the factory and tests construct this; cfg is always a SerialConfig.
    const auto& sc = static_cast<const SerialConfig&>(cfg);
    end();

    dev_path_      = sc.path;
    read_timeout_  = sc.read_timeout_ms;
    write_timeout_ = sc.write_timeout_ms;
    last_errno_    = 0;
    if (dev_path_.empty()) { last_errno_ = ENOENT; return false; }

    fd_ = open_serial(dev_path_, sc.baud, sc.boot_delay_ms, last_errno_);
    return fd_ >= 0;
  }

  void end() override {
    if (fd_ >= 0) { close_serial(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) override {
    written = 0;
    if (fd_ < 0 || !data) { last_errno_ = EBADF; return TxResult::Error; }
    IoResult r = write_bounded(fd_, data, len, static_cast<int>(write_timeout_), false);
    written = r.count;
    if (r.status == IoStatus::Ok)      return TxResult::Ok;
    if (r.status == IoStatus::Timeout) return TxResult::Timeout;
    last_errno_ = r.err ? r.err : EIO;
    return TxResult::Error;
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t min_len, std::size_t& out_len) override {
    out_len = 0;
    if (fd_ < 0 || !out || cap == 0) { last_errno_ = EBADF; return RxResult::Error; }
    IoResult r = read_bounded(fd_, out, cap, min_len, static_cast<int>(read_timeout_));
    out_len = r.count;
    switch (r.status) {
      case IoStatus::Ok:
      case IoStatus::Timeout: return out_len ? RxResult::Ok : RxResult::None;
      case IoStatus::Closed:  return out_len ? RxResult::Ok : RxResult::Closed;
      case IoStatus::Error:   break;
    }
    last_errno_ = r.err ? r.err : EIO;
    return RxResult::Error;
  }

  Kind kind() const override { return Kind::Serial; }
  const char* name() const override { return "linux-serial"; }
  int last_errno() const override { return last_errno_; }

  const std::string& path() const { return dev_path_; }

private:
  int fd_{-1};
  std::string dev_path_;
  uint32_t read_timeout_{100};
  uint32_t write_timeout_{1000};
  int last_errno_{0};
};

} // namespace dacwire::transport
