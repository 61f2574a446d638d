/* @file I2CDevice.cpp
 * @brief IO abstraction layer that wraps /dev/i2c-N - handles file descriptor, slave binding and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <errno.h>         // Error integer and strerror() function
#include <fcntl.h>         // Contains file controls like O_RDWR
#include <linux/i2c-dev.h> // I2C_SLAVE
#include <sys/ioctl.h>
#include <unistd.h> // write(), read(), close()

// Reveille headers
#include "io/I2CDevice.hpp"

using namespace reveille::io;

I2CDevice::~I2CDevice() { close(); }

I2CDevice::I2CDevice(I2CDevice&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), address_(other.address_), bus_(std::move(other.bus_)),
      lastError_(std::move(other.lastError_)) {}

I2CDevice& I2CDevice::operator=(I2CDevice&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    address_ = other.address_;
    bus_ = std::move(other.bus_);
    lastError_ = std::move(other.lastError_);
  }
  return *this;
}

bool I2CDevice::open(const std::string& bus, std::uint8_t address) {
  close();
  bus_ = bus;
  address_ = address;

  fd_ = ::open(bus.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0)
    return fail("open");

  if (::ioctl(fd_, I2C_SLAVE, static_cast<long>(address)) < 0) {
    fail("ioctl(I2C_SLAVE)");
    close();
    return false;
  }
  lastError_.clear();
  return true;
}

bool I2CDevice::writeBytes(const std::vector<std::uint8_t>& bytes) {
  if (fd_ < 0) {
    lastError_ = "device not open";
    return false;
  }

  // one write() is one I²C transaction, so a short write is an error, not a retry
  for (;;) {
    const ssize_t written = ::write(fd_, bytes.data(), bytes.size());
    if (written == static_cast<ssize_t>(bytes.size()))
      return true;
    if (written == -1 && errno == EINTR)
      continue;
    if (written >= 0) {
      lastError_ = "short write";
      return false;
    }
    return fail("write");
  }
}

bool I2CDevice::readRegisters(std::uint8_t reg, std::uint8_t* out, std::size_t count) {
  if (!writeBytes({ reg }))
    return false;

  for (;;) {
    const ssize_t n = ::read(fd_, out, count);
    if (n == static_cast<ssize_t>(count))
      return true;
    if (n == -1 && errno == EINTR)
      continue;
    if (n >= 0) {
      lastError_ = "short read";
      return false;
    }
    return fail("read");
  }
}

void I2CDevice::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

bool I2CDevice::fail(const char* what) {
  lastError_ = std::string(what) + ": " + std::strerror(errno);
  return false;
}
