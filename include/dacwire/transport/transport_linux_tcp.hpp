#pragma once
/**
 * @file transport_linux_tcp.hpp
 * @brief Linux TCP client transport (header-only, one persistent stream, TCP_NODELAY).
 *
 * Depends on: tcp_io.hpp for the bounded connect, fd_io.hpp for bounded I/O.
 */

#if !defined(__linux__)
#  error "transport_linux_tcp.hpp is Linux-only."
#endif

#include "dacwire/transport/transport_base.hpp"
#include "tcp_io.hpp"
#include "fd_io.hpp"
#include <cerrno>
#include <string>

namespace dacwire::transport {

struct TcpConfig : public Config {
  std::string host;    // numeric, no brackets
  uint16_t port{0};
  bool ipv6{false};
  uint32_t connect_timeout_ms{5000};
};

class LinuxTcp : public ITransport {
public:
  LinuxTcp() = default;
  ~LinuxTcp() override { end(); }

  LinuxTcp(const LinuxTcp&) = delete;
  LinuxTcp& operator=(const LinuxTcp&) = delete;

  bool begin(const Config& cfg) override {
    const auto& tc = static_cast<const TcpConfig&>(cfg);
    end();

    host_          = tc.host;
    port_          = tc.port;
    read_timeout_  = tc.read_timeout_ms;
    write_timeout_ = tc.write_timeout_ms;
    last_errno_    = 0;

    fd_ = connect_tcp(host_, port_, tc.ipv6, static_cast<int>(tc.connect_timeout_ms), last_errno_);
    return fd_ >= 0;
  }

  void end() override {
    if (fd_ >= 0) { close_tcp(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) override {
    written = 0;
    if (fd_ < 0 || !data) { last_errno_ = EBADF; return TxResult::Error; }
    IoResult r = write_bounded(fd_, data, len, static_cast<int>(write_timeout_), true);
    written = r.count;
    if (r.status == IoStatus::Ok)      return TxResult::Ok;
    if (r.status == IoStatus::Timeout) return TxResult::Timeout;
    last_errno_ = r.err ? r.err : EPIPE;
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

  Kind kind() const override { return Kind::Tcp; }
  const char* name() const override { return "linux-tcp"; }
  int last_errno() const override { return last_errno_; }

private:
  int fd_{-1};
  std::string host_;
  uint16_t port_{0};
  uint32_t read_timeout_{200};
  uint32_t write_timeout_{1000};
  int last_errno_{0};
};

} // namespace dacwire::transport
