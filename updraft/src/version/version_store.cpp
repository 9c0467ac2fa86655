#include "updraft/version/version_store.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <unistd.h>

namespace updraft {

namespace fs = std::filesystem;

std::string to_string(VersionErrorCode code) {
    switch (code) {
        case VersionErrorCode::NO_CURRENT_VERSION:  return "no_current_version";
        case VersionErrorCode::IO_FAILURE:          return "io_failure";
        case VersionErrorCode::PERSISTENCE_FAILURE: return "persistence_failure";
        case VersionErrorCode::CORRUPT_HISTORY:     return "corrupt_history";
        default: return "unknown";
    }
}

namespace {

VersionError io_error(const ManifestError& error) {
    return VersionError{VersionErrorCode::IO_FAILURE, error.message};
}

std::string join(const std::vector<std::string>& versions) {
    std::string out = "[";
    for (size_t i = 0; i < versions.size(); ++i) {
        if (i > 0) out += ", ";
        out += versions[i];
    }
    return out + "]";
}

} // namespace

// ============================================================================
// 생성 / 로드
// ============================================================================

VersionStore::VersionStore(const SupervisorContext& context,
                           fs::path versions_dir,
                           size_t max_versions,
                           std::vector<std::string> scan_exclude)
    : logger_(context.logger_for("version_store"))
    , versions_dir_(std::move(versions_dir))
    , max_versions_(std::max<size_t>(max_versions, 1))
    , scan_exclude_(std::move(scan_exclude)) {

    std::error_code ec;
    fs::create_directories(versions_dir_, ec);
    if (ec) {
        logger_.error("Cannot create versions directory " + versions_dir_.string() + ": " + ec.message());
    }
}

fs::path VersionStore::history_file() const {
    return versions_dir_ / HISTORY_FILE_NAME;
}

std::expected<void, VersionError> VersionStore::load() {
    versions_.clear();

    std::error_code ec;
    if (!fs::exists(history_file(), ec)) {
        logger_.info("No version history found, starting empty");
        return {};
    }

    std::ifstream in(history_file());
    if (!in) {
        return std::unexpected(VersionError{VersionErrorCode::CORRUPT_HISTORY,
                                            "Cannot open " + history_file().string()});
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("versions") || !doc["versions"].is_array()) {
        return std::unexpected(VersionError{VersionErrorCode::CORRUPT_HISTORY,
                                            "Malformed version history: " + history_file().string()});
    }

    std::vector<std::string> loaded;
    std::unordered_set<std::string> seen;
    for (const auto& entry : doc["versions"]) {
        if (!entry.is_string()) {
            return std::unexpected(VersionError{VersionErrorCode::CORRUPT_HISTORY,
                                                "Non-string entry in " + history_file().string()});
        }
        auto version = entry.get<std::string>();
        if (!seen.insert(version).second) {
            logger_.warn("Ignoring duplicate history entry " + version);
            continue;
        }
        loaded.push_back(std::move(version));
    }

    // 보존 한도가 이전 실행보다 줄어든 경우
    std::vector<std::string> evicted;
    while (loaded.size() > max_versions_) {
        evicted.push_back(loaded.front());
        loaded.erase(loaded.begin());
    }

    if (!evicted.empty()) {
        if (auto saved = persist(loaded); !saved) {
            return saved;
        }
        for (const auto& version : evicted) {
            remove_version_dir(version);
        }
    }

    versions_ = std::move(loaded);
    logger_.info("Version history: " + join(versions_));
    return {};
}

// ============================================================================
// 이력 조회
// ============================================================================

std::optional<std::string> VersionStore::get_current() const {
    if (versions_.empty()) {
        return std::nullopt;
    }
    return versions_.back();
}

std::optional<std::string> VersionStore::get_previous() const {
    if (versions_.size() < 2) {
        return std::nullopt;
    }
    return versions_[versions_.size() - 2];
}

bool VersionStore::contains(const std::string& version) const {
    return std::find(versions_.begin(), versions_.end(), version) != versions_.end();
}

// ============================================================================
// 이력 변경
// ============================================================================

std::expected<void, VersionError> VersionStore::set_current(const std::string& version) {
    if (contains(version)) {
        logger_.debug("Version " + version + " already in history, not reordering");
        return {};
    }

    std::vector<std::string> updated = versions_;
    updated.push_back(version);

    std::vector<std::string> evicted;
    while (updated.size() > max_versions_) {
        evicted.push_back(updated.front());
        updated.erase(updated.begin());
    }

    if (auto saved = persist(updated); !saved) {
        logger_.error("Version history not updated: " + saved.error().message);
        return saved;
    }

    versions_ = std::move(updated);
    logger_.info("Current version set to " + version);

    for (const auto& old_version : evicted) {
        remove_version_dir(old_version);
    }

    return {};
}

std::expected<std::string, VersionError> VersionStore::retire_current() {
    if (versions_.empty()) {
        return std::unexpected(VersionError{VersionErrorCode::NO_CURRENT_VERSION,
                                            "No current version to retire"});
    }

    std::vector<std::string> updated(versions_.begin(), versions_.end() - 1);
    if (auto saved = persist(updated); !saved) {
        return std::unexpected(saved.error());
    }

    std::string retired = versions_.back();
    versions_ = std::move(updated);
    remove_version_dir(retired);

    logger_.warn("Retired version " + retired);
    return retired;
}

std::expected<void, VersionError> VersionStore::persist(const std::vector<std::string>& versions) const {
    nlohmann::json doc;
    doc["versions"] = versions;

    fs::path temp_path = history_file();
    temp_path += ".tmp" + std::to_string(::getpid());

    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            return std::unexpected(VersionError{VersionErrorCode::PERSISTENCE_FAILURE,
                                                "Cannot write " + temp_path.string()});
        }
        out << doc.dump() << '\n';
        out.flush();
        if (!out) {
            std::error_code cleanup_ec;
            fs::remove(temp_path, cleanup_ec);
            return std::unexpected(VersionError{VersionErrorCode::PERSISTENCE_FAILURE,
                                                "Short write to " + temp_path.string()});
        }
    }

    std::error_code ec;
    fs::rename(temp_path, history_file(), ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return std::unexpected(VersionError{VersionErrorCode::PERSISTENCE_FAILURE,
                                            "Cannot replace " + history_file().string() + ": " + ec.message()});
    }
    return {};
}

// ============================================================================
// 버전 디렉토리
// ============================================================================

fs::path VersionStore::version_dir(const std::string& version) const {
    std::string name;
    name.reserve(version.size());

    for (unsigned char c : version) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        name += allowed ? static_cast<char>(c) : '_';
    }

    if (name.empty() || name == "." || name == "..") {
        name = "_" + name;
    }

    return versions_dir_ / name;
}

std::expected<FileManifest, VersionError> VersionStore::backup_current(const fs::path& app_dir) {
    auto current = get_current();
    if (!current) {
        logger_.warn("No current version to backup");
        return std::unexpected(VersionError{VersionErrorCode::NO_CURRENT_VERSION,
                                            "No current version to backup"});
    }

    auto manifest = resolve_live_manifest(app_dir, scan_exclude_);
    if (!manifest) {
        return std::unexpected(io_error(manifest.error()));
    }
    manifest->version = *current;

    const fs::path target = version_dir(*current);
    if (auto copied = copy_manifest_files(*manifest, app_dir, target); !copied) {
        return std::unexpected(io_error(copied.error()));
    }

    if (auto saved = manifest->save(target / FileManifest::FILE_NAME); !saved) {
        return std::unexpected(io_error(saved.error()));
    }

    logger_.info("Backed up version " + *current + " (" + std::to_string(manifest->files.size()) + " files)");
    return std::move(*manifest);
}

std::expected<void, VersionError> VersionStore::initialize_from_existing(const fs::path& app_dir,
                                                                        const std::string& default_version) {
    if (!versions_.empty()) {
        logger_.warn("Version history already initialized, current is " + versions_.back());
        return {};
    }

    auto manifest = resolve_live_manifest(app_dir, scan_exclude_);
    if (!manifest) {
        logger_.error("Initialization failed: " + manifest.error().message);
        return std::unexpected(io_error(manifest.error()));
    }

    if (manifest->empty()) {
        logger_.warn("Application directory " + app_dir.string() + " has no files to register");
    }

    manifest->version = default_version;
    const fs::path target = version_dir(default_version);

    if (auto copied = copy_manifest_files(*manifest, app_dir, target); !copied) {
        logger_.error("Initialization failed: " + copied.error().message);
        return std::unexpected(io_error(copied.error()));
    }

    if (auto saved = manifest->save(target / FileManifest::FILE_NAME); !saved) {
        return std::unexpected(io_error(saved.error()));
    }

    if (auto saved = manifest->save(app_dir / FileManifest::FILE_NAME); !saved) {
        return std::unexpected(io_error(saved.error()));
    }

    if (auto committed = set_current(default_version); !committed) {
        return committed;
    }

    logger_.info("Initialized version history with " + default_version);
    return {};
}

std::expected<FileManifest, VersionError> VersionStore::manifest_for(const std::string& version) const {
    const fs::path dir = version_dir(version);
    const fs::path manifest_path = dir / FileManifest::FILE_NAME;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected(VersionError{VersionErrorCode::IO_FAILURE,
                                            "Version directory missing: " + dir.string()});
    }

    if (fs::exists(manifest_path, ec)) {
        auto manifest = FileManifest::load(manifest_path);
        if (!manifest) {
            return std::unexpected(io_error(manifest.error()));
        }
        return std::move(*manifest);
    }

    // 매니페스트 없이 남아 있는 오래된 스냅샷
    auto scanned = FileManifest::scan(dir);
    if (!scanned) {
        return std::unexpected(io_error(scanned.error()));
    }
    scanned->version = version;
    return std::move(*scanned);
}

void VersionStore::discard_staging(const std::string& version) {
    if (contains(version)) {
        return;
    }
    remove_version_dir(version);
}

void VersionStore::remove_version_dir(const std::string& version) {
    const fs::path dir = version_dir(version);

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return;
    }

    fs::remove_all(dir, ec);
    if (ec) {
        logger_.error("Error cleaning up version " + version + ": " + ec.message());
        return;
    }
    logger_.info("Cleaned up old version: " + version);
}

} // namespace updraft
