#include "updraft/remote/directory_remote_source.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <utility>

namespace updraft {

namespace fs = std::filesystem;

DirectoryRemoteSource::DirectoryRemoteSource(const SupervisorContext& context, fs::path feed_path)
    : logger_(context.logger_for("remote"))
    , feed_path_(std::move(feed_path)) {}

std::string DirectoryRemoteSource::describe() const {
    return "release feed " + feed_path_.string();
}

std::expected<std::optional<ReleaseDescriptor>, RemoteError> DirectoryRemoteSource::check_latest() {
    std::error_code ec;
    if (!fs::is_directory(feed_path_, ec)) {
        return std::unexpected(RemoteError{RemoteErrorCode::UNAVAILABLE,
                                           "Release feed not reachable: " + feed_path_.string()});
    }

    const fs::path latest_path = feed_path_ / LATEST_FILE_NAME;
    if (!fs::exists(latest_path, ec)) {
        logger_.debug("No release published in " + feed_path_.string());
        return std::optional<ReleaseDescriptor>{};
    }

    std::ifstream in(latest_path);
    if (!in) {
        return std::unexpected(RemoteError{RemoteErrorCode::UNAVAILABLE, "Cannot open " + latest_path.string()});
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(RemoteError{RemoteErrorCode::MALFORMED_RELEASE,
                                           latest_path.string() + " is not a JSON object"});
    }

    if (!doc.contains("version") || !doc["version"].is_string() || doc["version"].get<std::string>().empty()) {
        return std::unexpected(RemoteError{RemoteErrorCode::MALFORMED_RELEASE,
                                           latest_path.string() + " has no 'version'"});
    }

    ReleaseDescriptor release;
    release.identifier = doc["version"].get<std::string>();

    std::string relative = release.identifier;
    if (doc.contains("path")) {
        if (!doc["path"].is_string()) {
            return std::unexpected(RemoteError{RemoteErrorCode::MALFORMED_RELEASE,
                                               latest_path.string() + ": 'path' must be a string"});
        }
        relative = doc["path"].get<std::string>();
    }

    if (!is_safe_relative_path(relative)) {
        return std::unexpected(RemoteError{RemoteErrorCode::MALFORMED_RELEASE,
                                           "Release path escapes the feed: " + relative});
    }
    release.locator = (feed_path_ / relative).string();

    for (auto& item : doc.items()) {
        if (item.key() != "version" && item.key() != "path" && item.value().is_string()) {
            release.attributes[item.key()] = item.value().get<std::string>();
        }
    }

    logger_.debug("Latest release: " + release.identifier);
    return release;
}

std::expected<FileManifest, RemoteError> DirectoryRemoteSource::release_manifest(const ReleaseDescriptor& release,
                                                                                 const fs::path& release_dir) const {
    const fs::path manifest_path = release_dir / RELEASE_MANIFEST_NAME;

    std::error_code ec;
    if (fs::exists(manifest_path, ec)) {
        auto manifest = FileManifest::load(manifest_path);
        if (!manifest) {
            return std::unexpected(RemoteError{RemoteErrorCode::MALFORMED_RELEASE, manifest.error().message});
        }
        manifest->version = release.identifier;
        return std::move(*manifest);
    }

    auto scanned = FileManifest::scan(release_dir);
    if (!scanned) {
        return std::unexpected(RemoteError{RemoteErrorCode::TRANSFER_FAILED, scanned.error().message});
    }

    auto& files = scanned->files;
    files.erase(std::remove(files.begin(), files.end(), std::string(RELEASE_MANIFEST_NAME)), files.end());
    scanned->version = release.identifier;
    return std::move(*scanned);
}

std::expected<FileManifest, RemoteError> DirectoryRemoteSource::fetch(const ReleaseDescriptor& release,
                                                                      const fs::path& destination) {
    const fs::path release_dir = release.locator;

    std::error_code ec;
    if (!fs::is_directory(release_dir, ec)) {
        return std::unexpected(RemoteError{RemoteErrorCode::UNAVAILABLE,
                                           "Release directory missing: " + release_dir.string()});
    }

    auto manifest = release_manifest(release, release_dir);
    if (!manifest) {
        return manifest;
    }

    if (manifest->empty()) {
        return std::unexpected(RemoteError{RemoteErrorCode::MALFORMED_RELEASE,
                                           "Release " + release.identifier + " contains no files"});
    }

    fs::remove_all(destination, ec);
    if (ec) {
        return std::unexpected(RemoteError{RemoteErrorCode::TRANSFER_FAILED,
                                           "Cannot clear staging " + destination.string() + ": " + ec.message()});
    }

    if (auto copied = copy_manifest_files(*manifest, release_dir, destination); !copied) {
        return std::unexpected(RemoteError{RemoteErrorCode::TRANSFER_FAILED, copied.error().message});
    }

    if (auto saved = manifest->save(destination / FileManifest::FILE_NAME); !saved) {
        return std::unexpected(RemoteError{RemoteErrorCode::TRANSFER_FAILED, saved.error().message});
    }

    logger_.info("Downloaded " + release.identifier + " (" + std::to_string(manifest->files.size()) +
                 " files) to " + destination.string());
    return manifest;
}

// ============================================================================
// 팩토리
// ============================================================================

std::unique_ptr<RemoteSource> make_remote_source(const SupervisorContext& context, const RemoteSettings& settings) {
    switch (settings.kind) {
        case RemoteKind::DIRECTORY:
        default:
            return std::make_unique<DirectoryRemoteSource>(context, settings.feed_path);
    }
}

} // namespace updraft
