#pragma once
/** @file  JsonFileRepository.hpp
 *  @brief alarms.json / overrides.json persistence for the schedule store.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <memory>
#include <string>

#include "schedule/ScheduleRepository.hpp"

namespace reveille {
  namespace core {
    class Logger;
  }

  namespace io {

    /**
 * @class JsonFileRepository
 * @brief Id-keyed JSON objects, one file per collection, inside a data directory.
 *
 *  * A missing file loads as empty and is created on the spot.
 *  * Saves write `<file>.tmp` and rename it over the target, so a crash never
 *    leaves a half-written document.
 *  * A record that fails to decode is skipped with a warning; a document that
 *    is not a JSON object throws PersistenceError.
 */
    class JsonFileRepository : public schedule::ScheduleRepository {
    public:
      JsonFileRepository(std::filesystem::path dataDirectory, std::shared_ptr<core::Logger> log);

      schedule::AlarmMap loadAlarms() override;
      schedule::OverrideMap loadOverrides() override;
      void saveAlarms(const schedule::AlarmMap& alarms) override;
      void saveOverrides(const schedule::OverrideMap& overrides) override;

      std::filesystem::path alarmsFile() const { return dir_ / "alarms.json"; }
      std::filesystem::path overridesFile() const { return dir_ / "overrides.json"; }

    private:
      std::filesystem::path dir_;
      std::shared_ptr<core::Logger> log_;
    };

  } // namespace io
} // namespace reveille
