#pragma once
/** @file  I2CDevice.hpp
 *  @brief RAII owner of one /dev/i2c-* descriptor bound to a slave address.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reveille {
  namespace io {

    /**
 * @class I2CDevice
 * @brief Register-level access to a single chip on a Linux I²C adapter.
 *
 *  * `open()` binds the descriptor to the slave with `ioctl(I2C_SLAVE)`.
 *  * Transfers never throw; they return false and keep the errno text in
 *    `lastError()` for the caller to log.
 *  * *Non-copyable*, but move-constructible.
 */
    class I2CDevice {

    public:
      //---ctr / dtr--------------------------------------------
      I2CDevice() = default;
      virtual ~I2CDevice(); // close the /dev/i2c fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& bus, std::uint8_t address);
      virtual bool writeBytes(const std::vector<std::uint8_t>& bytes); // returns false on EIO
      /// Set the register pointer to \p reg, then read \p count bytes from there.
      virtual bool readRegisters(std::uint8_t reg, std::uint8_t* out, std::size_t count);
      void close();

      bool isOpen() const { return fd_ >= 0; }
      std::uint8_t address() const { return address_; }
      const std::string& bus() const { return bus_; }
      const std::string& lastError() const { return lastError_; }

      //---non-copyable-----------------------------------------
      I2CDevice(const I2CDevice&) = delete;
      I2CDevice& operator=(const I2CDevice&) = delete;

      //---mv and mv assign-------------------------------------
      I2CDevice(I2CDevice&& other) noexcept;
      I2CDevice& operator=(I2CDevice&& other) noexcept;

    private:
      bool fail(const char* what);

      int fd_{ -1 };               ///< POSIX fd (-1==closed)
      std::uint8_t address_{ 0 };  ///< 7-bit slave address
      std::string bus_{};
      std::string lastError_{};
    };
  } // namespace io
} // namespace reveille
