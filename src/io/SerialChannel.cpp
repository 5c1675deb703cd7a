/* @file SerialChannel.cpp
 * @brief line-framed tty I/O for the RFID reader link - fd ownership, framing, RAII - POSIX compliant
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// Pantheon headers
#include "io/SerialChannel.hpp"

using namespace pantheon::io;

SerialChannel::~SerialChannel() { SerialChannel::close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

std::optional<speed_t> SerialChannel::toSpeed(unsigned int baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  default:
    return std::nullopt;
  }
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "[SerialChannel] Error " << errno << " opening " << dev << ": " << strerror(errno)
              << "\n";
    return false;
  }

  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "[SerialChannel] Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  // raw 8N1, no flow control
  cfmakeraw(&tty);
  tty.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
  tty.c_cflag |= CS8 | CREAD | CLOCAL;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "[SerialChannel] Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  rx_buffer_.clear();
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {
  if (fd_ < 0)
    return false;

  std::string out = line;
  if (!out.ends_with("\r\n"))
    out += "\r\n";

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // tty output queue full: wait until writable instead of spinning
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 100) < 0 && errno != EINTR) {
        std::cerr << "[SerialChannel] poll(POLLOUT): " << strerror(errno) << "\n";
        return false;
      }
    } else {
      std::cerr << "[SerialChannel] Error " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }
  return true;
}

std::optional<std::string> SerialChannel::takeLine() {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;

  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Returns the next complete line, std::nullopt on timeout, disconnect or
// error. A partial line stays buffered for the next call.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  if (auto line = takeLine())
    return line;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());

    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      std::cerr << "[SerialChannel] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLHUP | POLLERR)) {
      close();
      return std::nullopt;
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      } else {
        std::cerr << "[SerialChannel] read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    }
  }
  return std::nullopt;
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
