/* @file SystemCoordinator.cpp
 * @brief daemon start-up order, signal wait, degraded mode and orderly shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <stdexcept>
#include <string>

// Linux headers
#include <pthread.h>
#include <signal.h>

// 3rd party headers
#include <nlohmann/json.hpp>

// Reveille headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SettingsStore.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/DeviceHub.hpp"
#include "io/JsonFileRepository.hpp"

using namespace reveille::core;

namespace {

  constexpr const char* kTag = "coordinator";

  sigset_t shutdownSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
  }

} // namespace

const char* reveille::core::toString(SystemCoordinator::State s) {
  switch (s) {
  case SystemCoordinator::State::BOOT:
    return "BOOT";
  case SystemCoordinator::State::INIT:
    return "INIT";
  case SystemCoordinator::State::RUNNING:
    return "RUNNING";
  case SystemCoordinator::State::DEGRADED:
    return "DEGRADED";
  case SystemCoordinator::State::STOPPING:
    return "STOPPING";
  case SystemCoordinator::State::STOPPED:
    return "STOPPED";
  default:
    return "UNKNOWN";
  }
}

SystemCoordinator::SystemCoordinator()
    : log_(std::make_shared<Logger>()), errors_(std::make_shared<ErrorMonitor>()),
      settings_(std::make_shared<SettingsStore>()) {
  errors_->registerEscalation([this](const std::string& reason) { handleError(reason); });
}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

void SystemCoordinator::blockShutdownSignals() {
  const sigset_t set = shutdownSignals();
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

// -------------------------------------------------------------------
// SystemCoordinator::initialize
//  config → logger → settings → devices → service → push device settings
// -------------------------------------------------------------------
void SystemCoordinator::initialize(const std::string& configPath) {
  transitionTo(State::INIT);

  loader_ = std::make_unique<ConfigLoader>(configPath);
  cfg_ = loader_->loadConfig();

  if (auto level = parseLogLevel(cfg_.logLevel))
    log_->setMinLevel(*level);
  else
    log_->warn(kTag, "Unknown log_level '" + cfg_.logLevel + "', using info");
  if (!log_->start(cfg_.logFile))
    log_->warn(kTag, "Cannot open log file " + cfg_.logFile + ", logging to stderr only");
  log_->info(kTag, "Configuration loaded from " + configPath);

  settings_->set(Setting::SnoozeMinutes, cfg_.snoozeMinutes);
  settings_->set(Setting::TimeoutMinutes, cfg_.timeoutMinutes);
  settings_->set(Setting::CheckIntervalSeconds, cfg_.checkIntervalSeconds);
  settings_->set(Setting::Volume, cfg_.volume);
  settings_->set(Setting::DisplayBrightness, cfg_.displayBrightness);

  io::DeviceConfig devCfg;
  devCfg.useMock = cfg_.useMockHardware;
  devCfg.i2cBus = cfg_.i2cBus;
  devCfg.rtcAddress = cfg_.rtcAddress;
  devCfg.displayAddress = cfg_.displayAddress;
  devCfg.soundsDirectory = cfg_.soundsDirectory;
  devices_ = io::openDeviceHub(devCfg, log_, errors_);

  auto repo = std::make_shared<io::JsonFileRepository>(cfg_.dataDirectory, log_);
  service_ = std::make_unique<AlarmService>(repo, devices_, settings_, log_, errors_);
  service_->load();

  devices_->setVolume(settings_->get(Setting::Volume));
  devices_->setBrightness(settings_->get(Setting::DisplayBrightness));
  devices_->setIndicator(false);
}

void SystemCoordinator::run() {
  assert(service_ && "[SystemCoordinator] run() before initialize()");

  service_->start();
  transitionTo(faulted_ ? State::DEGRADED : State::RUNNING);
  if (auto next = service_->nextAlarmInfo())
    log_->info(kTag, "Next alarm " + next->alarmId + " at " + schedule::toString(next->targetDate) +
                         " " + next->time.toString());

  const sigset_t set = shutdownSignals();
  int sig = 0;
  while (sigwait(&set, &sig) != 0) {
  }
  log_->info(kTag, std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM"));

  shutdown();
}

void SystemCoordinator::shutdown() {
  const auto s = state();
  if (s == State::BOOT || s == State::STOPPING || s == State::STOPPED)
    return;

  transitionTo(State::STOPPING);
  if (service_)
    service_->stop();
  if (devices_) {
    devices_->stop();
    devices_->setIndicator(false);
  }
  for (const auto& fault : errors_->faults())
    log_->warn(kTag, "Fault this run (x" + std::to_string(fault.occurrences) + "): " + fault.message);
  transitionTo(State::STOPPED);
  log_->stop();
}

void SystemCoordinator::handleError(const std::string& reason) {
  faulted_ = true;
  log_->error(kTag, "Fault escalated: " + reason);
  if (state() == State::RUNNING)
    transitionTo(State::DEGRADED);
}

SettingsPatch SystemCoordinator::updateSettings(const SettingsPatch& patch) {
  const auto stored = service().updateSettings(patch);

  try {
    auto doc = loader_->load();
    if (stored.snoozeMinutes)
      doc["snooze_duration_minutes"] = *stored.snoozeMinutes;
    if (stored.timeoutMinutes)
      doc["timeout_minutes"] = *stored.timeoutMinutes;
    if (stored.volume)
      doc["volume"] = *stored.volume;
    if (stored.displayBrightness)
      doc["display_brightness"] = *stored.displayBrightness;
    loader_->save(doc);
  } catch (const std::runtime_error& e) {
    log_->error(kTag, std::string("Settings applied but not saved: ") + e.what());
    errors_->notifyFailure(std::string("[SystemCoordinator] ") + e.what());
  }
  return stored;
}

AlarmService& SystemCoordinator::service() {
  if (!service_)
    throw std::logic_error("[SystemCoordinator] service() before initialize()");
  return *service_;
}

void SystemCoordinator::transitionTo(State next) {
  const auto prev = currentState_.exchange(next);
  if (prev != next)
    log_->info(kTag, std::string("State ") + toString(prev) + " -> " + toString(next));
}
