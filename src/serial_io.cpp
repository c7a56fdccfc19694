// ============================================================================
// serial_io.cpp - implementation for serial_io.hpp
// For API/overview see the matching .hpp. For usage, see the LinuxSerial transport.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"   // open_serial(), close_serial()

#include <cerrno>
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers

namespace dacwire {

// ---------------------------------------------------------------------------
// to_speed()
// ----------
// Map a baud integer to its termios constant. Returns false for rates we do
// not carry; the caller then uses B115200.
// ---------------------------------------------------------------------------
static bool to_speed(int baud, speed_t& sp) {
    switch (baud) {
        case 9600:   sp = B9600;   return true;
        case 19200:  sp = B19200;  return true;
        case 38400:  sp = B38400;  return true;
        case 57600:  sp = B57600;  return true;
        case 115200: sp = B115200; return true;
#ifdef B230400
        case 230400: sp = B230400; return true;
#endif
#ifdef B460800
        case 460800: sp = B460800; return true;
#endif
#ifdef B921600
        case 921600: sp = B921600; return true;
#endif
        default: return false;
    }
}

bool baud_supported(int baud) {
    speed_t sp;
    return to_speed(baud, sp);
}


// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw 8N1 I/O at the given speed.
// - cfmakeraw() clears echo, canonical mode and parity.
// - CSTOPB cleared: one stop bit. CRTSCTS cleared: no hardware flow control.
// - VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
//
// Returns: true on success, false if tcgetattr/tcsetattr fails (errno set).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

    cfmakeraw(&tio);                              // raw 8N1
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~(CSTOPB | CRTSCTS);           // 1 stop bit, no RTS/CTS
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);       // no XON/XOFF
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port.
// - O_NOCTTY: don't steal the controlling terminal. O_NONBLOCK: poll() waits.
// - Unknown baud values fall back to 115200.
// - Any failing step closes the fd and reports its errno.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms, int& err) {
    err = 0;
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) { err = errno; return -1; }        // missing, permission, busy...

    speed_t sp = B115200;
    if (!to_speed(baud, sp)) sp = B115200;

    if (!set_raw(fd, sp)) {
        err = errno ? errno : ENOTTY;              // not a tty, or driver refused
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) {
        usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);   // let USB CDC settle
        tcflush(fd, TCIOFLUSH);                                  // drop boot chatter
    }
    return fd;
}


// ---------------------------------------------------------------------------
// close_serial()
// --------------
// Close a serial fd if valid (>=0).
// ---------------------------------------------------------------------------
void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace dacwire
