#pragma once
/**
 * @file transport_base.hpp
 * @brief Transport interface the Session talks to: serial and TCP implement it.
 *
 * Header-only on purpose. No STL beyond what the signatures need.
 */

#include <cstddef>
#include <cstdint>

namespace dacwire::transport {

// Return codes kept small; the detail lives in last_errno().
enum class TxResult : uint8_t { Ok=0, Timeout=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2, Closed=3 };

enum class Kind : uint8_t { Serial=0, Tcp=1 };

struct Config {
  // Concrete transports extend this (SerialConfig, TcpConfig).
  uint32_t read_timeout_ms{100};
  uint32_t write_timeout_ms{1000};
};

/**
 * @brief Transport trait the Session relies on.
 *
 * Contract:
 *  - begin(cfg) opens the channel; false on failure with last_errno() set.
 *  - send(buf,len,written) blocks up to the write timeout. Timeout with written < len is
 *    partial progress, not an error. Error means the channel is gone.
 *  - recv(buf,cap,min_len,out_len) blocks up to the read timeout waiting for min_len
 *    bytes. None = nothing arrived, Ok = at least one byte (check out_len against
 *    min_len for partial), Closed = peer went away.
 *  - end() releases the channel exactly once; later calls are no-ops.
 *  - No internal buffering beyond the OS channel; one operation per call.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual bool        is_open() const = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len, std::size_t& written) = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t min_len, std::size_t& out_len) = 0;
  virtual Kind        kind() const = 0;
  virtual const char* name() const = 0;
  virtual int         last_errno() const = 0;
};

inline const char* kind_name(Kind k) { return k == Kind::Tcp ? "TCP" : "Serial"; }

} // namespace dacwire::transport
