/* @file JsonFileRepository.cpp
 * @brief read / atomically replace the two JSON record documents
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <system_error>

// 3rd party headers
#include <nlohmann/json.hpp>

// Reveille headers
#include "core/Logger.hpp"
#include "io/JsonFileRepository.hpp"

using namespace reveille::io;
using reveille::schedule::PersistenceError;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

  constexpr const char* kTag = "repository";

  void writeDocument(const fs::path& file, const json& doc) {
    std::string text;
    try {
      text = doc.dump(2);
    } catch (const json::exception& e) {
      throw PersistenceError("[JsonFileRepository] cannot serialise " + file.filename().string() +
                             ": " + e.what());
    }

    const fs::path tmp = file.string() + ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out)
        throw PersistenceError("[JsonFileRepository] cannot open " + tmp.string() + " for writing");
      out << text << '\n';
      out.flush();
      if (!out)
        throw PersistenceError("[JsonFileRepository] write to " + tmp.string() + " failed");
    }

    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec)
      throw PersistenceError("[JsonFileRepository] rename to " + file.string() +
                             " failed: " + ec.message());
  }

  json readDocument(const fs::path& file, reveille::core::Logger& log) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
      log.info(kTag, "No " + file.filename().string() + " yet, starting empty");
      writeDocument(file, json::object());
      return json::object();
    }

    std::ifstream in(file);
    if (!in)
      throw PersistenceError("[JsonFileRepository] cannot open " + file.string());

    json doc;
    try {
      in >> doc;
    } catch (const json::parse_error& e) {
      throw PersistenceError("[JsonFileRepository] " + file.string() + ": " + e.what());
    }
    if (!doc.is_object())
      throw PersistenceError("[JsonFileRepository] " + file.string() + " is not a JSON object");
    return doc;
  }

  // Decode every entry; a bad one is logged and left out.
  template <typename Record>
  std::map<std::string, Record> decodeAll(const json& doc, const char* kind,
                                          reveille::core::Logger& log) {
    std::map<std::string, Record> out;
    for (const auto& [key, value] : doc.items()) {
      try {
        auto rec = value.template get<Record>();
        if (rec.id != key)
          log.warn(kTag, std::string(kind) + " stored under key " + key + " has id " + rec.id +
                             ", using the key");
        rec.id = key;
        out.emplace(key, std::move(rec));
      } catch (const std::exception& e) {
        log.warn(kTag, std::string("Skipping malformed ") + kind + " " + key + ": " + e.what());
      }
    }
    return out;
  }

  void warnUnknownDays(const json& doc, reveille::core::Logger& log) {
    for (const auto& [key, value] : doc.items()) {
      const auto it = value.find("days");
      if (it == value.end())
        continue;
      const json days = it->is_string() ? json::array({ *it }) : *it;
      if (!days.is_array())
        continue;
      for (const auto& d : days) {
        if (!d.is_string() || !reveille::schedule::tryParseWeekday(d.get<std::string>()))
          log.warn(kTag, "Alarm " + key + ": dropping unknown day " + d.dump());
      }
    }
  }

} // namespace

JsonFileRepository::JsonFileRepository(fs::path dataDirectory, std::shared_ptr<core::Logger> log)
    : dir_(std::move(dataDirectory)), log_(std::move(log)) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec)
    log_->error(kTag, "Cannot create data directory " + dir_.string() + ": " + ec.message());
}

reveille::schedule::AlarmMap JsonFileRepository::loadAlarms() {
  const json doc = readDocument(alarmsFile(), *log_);
  warnUnknownDays(doc, *log_);
  auto alarms = decodeAll<schedule::AlarmDefinition>(doc, "alarm", *log_);
  return alarms;
}

reveille::schedule::OverrideMap JsonFileRepository::loadOverrides() {
  const json doc = readDocument(overridesFile(), *log_);
  auto overrides = decodeAll<schedule::Override>(doc, "override", *log_);
  return overrides;
}

void JsonFileRepository::saveAlarms(const schedule::AlarmMap& alarms) {
  json doc = json::object();
  for (const auto& [id, alarm] : alarms)
    doc[id] = alarm;
  writeDocument(alarmsFile(), doc);
}

void JsonFileRepository::saveOverrides(const schedule::OverrideMap& overrides) {
  json doc = json::object();
  for (const auto& [id, ovr] : overrides)
    doc[id] = ovr;
  writeDocument(overridesFile(), doc);
}
