#include "config/settings_store.hpp"

#include "config/settings_model.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cosmicam::config {

namespace {

using JsonValue = core::json::Value;

bool RejectUnknownDocument(std::string_view name, std::string& error) {
  if (IsKnownDocument(name)) {
    return false;
  }
  error = "unknown settings document: " + std::string(name);
  return true;
}

} // namespace

const std::vector<std::string>& KnownDocumentNames() {
  static const std::vector<std::string> names = {
      std::string(kCoordinatesDocument),
      std::string(kCameraProfilesDocument),
      std::string(kSystemSettingsDocument),
  };
  return names;
}

bool IsKnownDocument(std::string_view name) {
  for (const std::string& known : KnownDocumentNames()) {
    if (known == name) {
      return true;
    }
  }
  return false;
}

JsonValue DefaultDocument(std::string_view name) {
  if (name == kCoordinatesDocument) {
    return ToJson(DefaultCoordinates());
  }
  if (name == kCameraProfilesDocument) {
    return ToJson(DefaultProfiles());
  }
  if (name == kSystemSettingsDocument) {
    return ToJson(DefaultSystemSettings());
  }
  return JsonValue::MakeObject();
}

JsonFileSettingsStore::JsonFileSettingsStore(fs::path config_dir, core::logging::Logger& logger)
    : config_dir_(std::move(config_dir)), logger_(logger) {}

fs::path JsonFileSettingsStore::DocumentPath(std::string_view name) const {
  return config_dir_ / (std::string(name) + ".json");
}

bool JsonFileSettingsStore::Initialize(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!core::EnsureDirectory(config_dir_, error)) {
    return false;
  }

  for (const std::string& name : KnownDocumentNames()) {
    const fs::path path = DocumentPath(name);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      logger_.Info("creating default settings document", {{"path", path.string()}});
      if (!WriteDocumentLocked(name, DefaultDocument(name), error)) {
        return false;
      }
      continue;
    }

    JsonValue existing;
    std::string read_error;
    if (!ReadDocumentLocked(name, existing, read_error)) {
      logger_.Error("settings document is unreadable, restoring defaults",
                    {{"path", path.string()}, {"error", read_error}});
      if (!WriteDocumentLocked(name, DefaultDocument(name), error)) {
        return false;
      }
    }
  }
  return true;
}

bool JsonFileSettingsStore::Get(std::string_view name, JsonValue& document,
                                std::string& error) const {
  if (RejectUnknownDocument(name, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  return ReadDocumentLocked(name, document, error);
}

bool JsonFileSettingsStore::Update(std::string_view name, const JsonValue& partial,
                                   std::string& error) {
  if (RejectUnknownDocument(name, error)) {
    return false;
  }
  if (!partial.IsObject()) {
    error = "settings update for '" + std::string(name) + "' must be an object";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  JsonValue current;
  std::string read_error;
  if (!ReadDocumentLocked(name, current, read_error)) {
    // A missing or damaged document is rebuilt from defaults rather than
    // blocking the write.
    logger_.Warn("merging settings update into defaults",
                 {{"document", name}, {"error", read_error}});
    current = DefaultDocument(name);
  }

  core::json::MergeTopLevel(current, partial);
  if (!WriteDocumentLocked(name, current, error)) {
    logger_.Error("failed to persist settings document", {{"document", name}, {"error", error}});
    return false;
  }

  logger_.Info("settings document updated", {{"document", name}});
  return true;
}

bool JsonFileSettingsStore::ReadDocumentLocked(std::string_view name, JsonValue& document,
                                               std::string& error) const {
  const fs::path path = DocumentPath(name);
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }

  JsonValue parsed;
  std::string parse_error;
  if (!core::json::Parse(text, parsed, parse_error)) {
    error = path.string() + ": " + parse_error;
    return false;
  }
  if (!parsed.IsObject()) {
    error = path.string() + ": top-level value must be an object";
    return false;
  }

  document = std::move(parsed);
  return true;
}

bool JsonFileSettingsStore::WriteDocumentLocked(std::string_view name, const JsonValue& document,
                                                std::string& error) const {
  return core::WriteTextFileAtomic(DocumentPath(name), core::json::Serialize(document, 2) + "\n",
                                   error);
}

InMemorySettingsStore::InMemorySettingsStore() {
  for (const std::string& name : KnownDocumentNames()) {
    documents_.emplace(name, DefaultDocument(name));
  }
}

bool InMemorySettingsStore::Get(std::string_view name, JsonValue& document,
                                std::string& error) const {
  if (RejectUnknownDocument(name, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  ++get_calls_;
  if (fail_reads_) {
    error = "simulated settings read failure for '" + std::string(name) + "'";
    return false;
  }
  const auto it = documents_.find(name);
  if (it == documents_.end()) {
    error = "settings document not found: " + std::string(name);
    return false;
  }
  document = it->second;
  return true;
}

bool InMemorySettingsStore::Update(std::string_view name, const JsonValue& partial,
                                   std::string& error) {
  if (RejectUnknownDocument(name, error)) {
    return false;
  }
  if (!partial.IsObject()) {
    error = "settings update for '" + std::string(name) + "' must be an object";
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  ++update_calls_;
  if (fail_writes_) {
    error = "simulated settings write failure for '" + std::string(name) + "'";
    return false;
  }
  JsonValue& current = documents_[std::string(name)];
  core::json::MergeTopLevel(current, partial);
  return true;
}

void InMemorySettingsStore::Replace(std::string_view name, JsonValue document) {
  std::lock_guard<std::mutex> lock(mu_);
  documents_[std::string(name)] = std::move(document);
}

void InMemorySettingsStore::SetFailReads(bool fail) {
  std::lock_guard<std::mutex> lock(mu_);
  fail_reads_ = fail;
}

void InMemorySettingsStore::SetFailWrites(bool fail) {
  std::lock_guard<std::mutex> lock(mu_);
  fail_writes_ = fail;
}

std::size_t InMemorySettingsStore::get_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return get_calls_;
}

std::size_t InMemorySettingsStore::update_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return update_calls_;
}

bool ReadCoordinates(const ISettingsStore& store, sun::GeoCoordinates& coordinates,
                     std::string& error) {
  JsonValue document;
  if (!store.Get(kCoordinatesDocument, document, error)) {
    return false;
  }
  return ParseCoordinates(document, coordinates, error);
}

bool ReadProfiles(const ISettingsStore& store, ProfileMap& profiles, std::string& error) {
  JsonValue document;
  if (!store.Get(kCameraProfilesDocument, document, error)) {
    return false;
  }
  return ParseProfileMap(document, profiles, error);
}

bool ReadSystemSettings(const ISettingsStore& store, SystemSettings& settings,
                        std::string& error) {
  JsonValue document;
  if (!store.Get(kSystemSettingsDocument, document, error)) {
    return false;
  }
  return ParseSystemSettings(document, settings, error);
}

bool WriteCoordinates(ISettingsStore& store, const sun::GeoCoordinates& coordinates,
                      std::string& error) {
  return store.Update(kCoordinatesDocument, ToJson(coordinates), error);
}

bool WriteProfiles(ISettingsStore& store, const ProfileMap& profiles, std::string& error) {
  return store.Update(kCameraProfilesDocument, ToJson(profiles), error);
}

} // namespace cosmicam::config
