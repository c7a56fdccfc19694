/**
 * @page dw-serial-io-hdr dacwire Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw 8N1 mode for the DAC/GPIO controller.
 *
 * @details
 * PURPOSE
 * -------
 * The controller enumerates as a USB CDC ACM device (or sits behind a USB-serial adapter).
 * This header declares the two calls needed to get a descriptor to it and give it back.
 * Moving bytes is left to fd_io.hpp, which the TCP path shares.
 *
 * LINE SETTINGS
 * -------------
 * - 115200 baud by default, 8 data bits, no parity, 1 stop bit.
 * - No hardware or software flow control, no echo, no line processing.
 * - VMIN = VTIME = 0 and O_NONBLOCK: poll() owns all waiting.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   LinuxSerial::begin() -> open_serial() -> fd_io read/write -> close_serial()
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths across replugs.
 * - Permissions: the runtime user needs the dialout group (or an equivalent udev rule).
 *   A permission failure comes back as errno EACCES so the caller can say so.
 * - Boot delay: some CDC boards reset on open. A short delay plus a flush swallows their
 *   boot chatter before the first frame goes out. The controller does not need it, so the
 *   default is 0.
 *
 * EXAMPLE
 * -------
 * @code
 *   int err = 0;
 *   int fd = dacwire::open_serial("/dev/ttyACM0", 115200, 0, err);
 *   if (fd < 0) { // report strerror(err) }
 *   ...
 *   dacwire::close_serial(fd);
 * @endcode
 *
 * LIMITATIONS
 * -----------
 * - Baud table: common rates only. Unknown values fall back to 115200.
 * - Concurrency: one owner per descriptor. Two processes may open the same TTY; the
 *   kernel does not arbitrate and neither do we.
 */
#pragma once
#include <string>

namespace dacwire {

static constexpr int DEFAULT_BAUD = 115200;

/**
 * @brief Open a TTY and configure it for raw 8N1 I/O.
 *
 * @param dev            device path, e.g. "/dev/ttyACM0"
 * @param baud           9600, 19200, 38400, 57600, 115200, 230400, 460800, 921600
 * @param boot_delay_ms  sleep after open, then flush (0 = none)
 * @param err            errno of the failing step on error
 * @return file descriptor, or -1 on failure
 *
 * The descriptor is non-blocking; the caller owns it and must close_serial() it.
 */
int open_serial(const std::string& dev, int baud, int boot_delay_ms, int& err);

/**
 * @brief Close a descriptor from open_serial(). Negative values are ignored.
 */
void close_serial(int fd);

/// True when @p baud has a termios speed constant here.
bool baud_supported(int baud);

} // namespace dacwire
