#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads and saves the daemon's run-time configuration (JSON) on the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace reveille::core {

  /// Every recognised key of config.json, pre-filled with its default.
  struct DaemonConfig {
    bool useMockHardware{ true };
    std::string dataDirectory{ "." };
    std::string soundsDirectory{ "sounds" };
    std::string logFile{ "reveille.log" };
    std::string logLevel{ "info" };
    int snoozeMinutes{ 9 };
    int timeoutMinutes{ 5 };
    int checkIntervalSeconds{ 30 };
    int volume{ 80 };
    int displayBrightness{ 10 };
    std::string i2cBus{ "/dev/i2c-1" };
    std::uint8_t rtcAddress{ 0x68 };
    std::uint8_t displayAddress{ 0x70 };
  };

  /// Missing keys keep their defaults; unknown keys are ignored.
  void from_json(const nlohmann::json& j, DaemonConfig& cfg);
  void to_json(nlohmann::json& j, const DaemonConfig& cfg);

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * A missing file is not an error: it reads as `{}` so every default applies.
 *  * `save()` rewrites the whole document (indent 4); callers merge first.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// load() decoded into a DaemonConfig.
    DaemonConfig loadConfig() const;

    /// Replace the file with \p doc; throws `std::runtime_error` on I/O failure.
    void save(const nlohmann::json& doc) const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace reveille::core
