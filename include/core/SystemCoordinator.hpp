#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for reveille::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <memory>
#include <string>

#include "core/AlarmService.hpp"
#include "core/ConfigLoader.hpp"

namespace reveille {
  namespace io {
    class DeviceHub;
  }

  namespace core {

    class ErrorMonitor;
    class Logger;
    class SettingsStore;

    /**
 * @class SystemCoordinator
 * @brief Daemon FSM: wires config, logger, devices and the alarm service, then
 *        waits for a shutdown signal.
 *
 *  BOOT → INIT → RUNNING ⇄ DEGRADED → STOPPING → STOPPED
 *
 *  * Escalated faults move RUNNING to DEGRADED; the alarm loop keeps going.
 *  * `shutdown()` is idempotent and also runs from the destructor.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, RUNNING, DEGRADED, STOPPING, STOPPED };

      SystemCoordinator();
      ~SystemCoordinator();

      /// Load config, start logging, negotiate devices, load the schedule.
      /// Throws `std::runtime_error` if the configuration cannot be read.
      void initialize(const std::string& configPath);
      void run();      ///< start polling, block until SIGINT/SIGTERM, then shut down
      void shutdown(); ///< forced dismiss, release devices, flush the log
      void handleError(const std::string& reason);

      /// Apply through the service and persist the stored values to config.json.
      SettingsPatch updateSettings(const SettingsPatch& patch);

      State state() const { return currentState_.load(); }
      AlarmService& service(); ///< valid after initialize()
      const DaemonConfig& config() const { return cfg_; }

      /// Block SIGINT/SIGTERM in the calling thread; threads spawned later inherit it.
      static void blockShutdownSignals();

    private:
      void transitionTo(State next);

      std::atomic<State> currentState_{ State::BOOT };
      std::atomic<bool> faulted_{ false };

      std::unique_ptr<ConfigLoader> loader_;
      DaemonConfig cfg_;
      std::shared_ptr<Logger> log_;
      std::shared_ptr<ErrorMonitor> errors_;
      std::shared_ptr<SettingsStore> settings_;
      std::shared_ptr<io::DeviceHub> devices_;
      std::unique_ptr<AlarmService> service_;
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace reveille
