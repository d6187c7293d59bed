#pragma once

#include "config/settings_model.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::config {

constexpr std::string_view kCoordinatesDocument = "coordinates";
constexpr std::string_view kCameraProfilesDocument = "camera_profiles";
constexpr std::string_view kSystemSettingsDocument = "system_settings";

// Names of every document the store manages, in a fixed order.
const std::vector<std::string>& KnownDocumentNames();
bool IsKnownDocument(std::string_view name);

// Built-in contents of a known document. Used to seed missing files and as the
// degraded-mode fallback when a document cannot be read.
core::json::Value DefaultDocument(std::string_view name);

// Durable key -> document store shared between the capture loop and
// out-of-band editors (CLI, API layer).
//
// Contract:
// - `Get` always reads the backing storage; implementations must not cache,
//   so an edit made by another process is visible on the very next call.
// - `Update` reads the current document, merges `partial` into it key by key
//   (top level only) and overwrites the whole document.
// - Unknown document names are errors.
class ISettingsStore {
public:
  virtual ~ISettingsStore() = default;

  virtual bool Get(std::string_view name, core::json::Value& document,
                   std::string& error) const = 0;

  virtual bool Update(std::string_view name, const core::json::Value& partial,
                      std::string& error) = 0;
};

// One pretty-printed `<name>.json` file per document under a config directory.
// Writes go through a temp file + rename so readers never see half a document.
class JsonFileSettingsStore final : public ISettingsStore {
public:
  JsonFileSettingsStore(std::filesystem::path config_dir, core::logging::Logger& logger);

  // Creates the directory, seeds missing documents from defaults and
  // restores defaults over documents that no longer parse.
  bool Initialize(std::string& error);

  bool Get(std::string_view name, core::json::Value& document,
           std::string& error) const override;

  bool Update(std::string_view name, const core::json::Value& partial,
              std::string& error) override;

  std::filesystem::path DocumentPath(std::string_view name) const;

  const std::filesystem::path& config_dir() const {
    return config_dir_;
  }

private:
  bool ReadDocumentLocked(std::string_view name, core::json::Value& document,
                          std::string& error) const;
  bool WriteDocumentLocked(std::string_view name, const core::json::Value& document,
                           std::string& error) const;

  std::filesystem::path config_dir_;
  core::logging::Logger& logger_;
  mutable std::mutex mu_;
};

// Process-local store for tests and dry runs. Failure injection lets tests
// exercise the degraded read path and the write-failure contract.
class InMemorySettingsStore final : public ISettingsStore {
public:
  InMemorySettingsStore();

  bool Get(std::string_view name, core::json::Value& document,
           std::string& error) const override;

  bool Update(std::string_view name, const core::json::Value& partial,
              std::string& error) override;

  void Replace(std::string_view name, core::json::Value document);
  void SetFailReads(bool fail);
  void SetFailWrites(bool fail);

  std::size_t get_calls() const;
  std::size_t update_calls() const;

private:
  std::map<std::string, core::json::Value, std::less<>> documents_;
  bool fail_reads_ = false;
  bool fail_writes_ = false;
  mutable std::size_t get_calls_ = 0;
  std::size_t update_calls_ = 0;
  mutable std::mutex mu_;
};

// Typed reads: fetch the named document fresh and parse it.
bool ReadCoordinates(const ISettingsStore& store, sun::GeoCoordinates& coordinates,
                     std::string& error);
bool ReadProfiles(const ISettingsStore& store, ProfileMap& profiles, std::string& error);
bool ReadSystemSettings(const ISettingsStore& store, SystemSettings& settings, std::string& error);

// Typed writes through the store's merge-then-overwrite update.
bool WriteCoordinates(ISettingsStore& store, const sun::GeoCoordinates& coordinates,
                      std::string& error);
bool WriteProfiles(ISettingsStore& store, const ProfileMap& profiles, std::string& error);

} // namespace cosmicam::config
