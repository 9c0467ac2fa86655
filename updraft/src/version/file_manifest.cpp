#include "updraft/version/file_manifest.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fnmatch.h>
#include <fstream>
#include <set>
#include <sstream>
#include <unistd.h>

namespace updraft {

namespace fs = std::filesystem;

namespace {

bool is_excluded(const fs::path& relative, const std::vector<std::string>& exclude) {
    for (const auto& component : relative) {
        const std::string name = component.string();
        if (name.empty()) {
            continue;
        }
        if (name.front() == '.') {
            return true;
        }
        for (const auto& pattern : exclude) {
            if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
                return true;
            }
        }
    }
    return false;
}

std::expected<std::string, ManifestError> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(ManifestError{"Cannot open " + path.string()});
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(ManifestError{"Cannot read " + path.string()});
    }
    return content.str();
}

} // namespace

// ============================================================================
// FileManifest 구현
// ============================================================================

bool FileManifest::contains(const std::string& relative_path) const {
    return std::find(files.begin(), files.end(), relative_path) != files.end();
}

void FileManifest::normalize() {
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
}

std::string FileManifest::to_json() const {
    nlohmann::json doc;
    doc["version"] = version;
    doc["files"] = files;
    return doc.dump(2);
}

std::expected<FileManifest, ManifestError> FileManifest::from_json(const std::string& text) {
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(ManifestError{"Manifest is not a JSON object"});
    }

    FileManifest manifest;

    if (doc.contains("version")) {
        if (!doc["version"].is_string()) {
            return std::unexpected(ManifestError{"Manifest 'version' must be a string"});
        }
        manifest.version = doc["version"].get<std::string>();
    }

    if (!doc.contains("files") || !doc["files"].is_array()) {
        return std::unexpected(ManifestError{"Manifest 'files' must be an array"});
    }

    for (const auto& entry : doc["files"]) {
        if (!entry.is_string()) {
            return std::unexpected(ManifestError{"Manifest file entries must be strings"});
        }
        auto relative = entry.get<std::string>();
        if (!is_safe_relative_path(relative)) {
            return std::unexpected(ManifestError{"Manifest entry escapes its directory: " + relative});
        }
        manifest.files.push_back(fs::path(relative).lexically_normal().generic_string());
    }

    manifest.normalize();
    return manifest;
}

std::expected<FileManifest, ManifestError> FileManifest::load(const fs::path& manifest_path) {
    auto content = read_file(manifest_path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto manifest = from_json(*content);
    if (!manifest) {
        return std::unexpected(ManifestError{manifest_path.string() + ": " + manifest.error().message});
    }
    return manifest;
}

std::expected<void, ManifestError> FileManifest::save(const fs::path& manifest_path) const {
    std::error_code ec;
    if (manifest_path.has_parent_path()) {
        fs::create_directories(manifest_path.parent_path(), ec);
        if (ec) {
            return std::unexpected(ManifestError{"Cannot create " + manifest_path.parent_path().string() +
                                                 ": " + ec.message()});
        }
    }

    fs::path temp_path = manifest_path;
    temp_path += ".tmp" + std::to_string(::getpid());

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(ManifestError{"Cannot write " + temp_path.string()});
        }
        out << to_json() << '\n';
        out.flush();
        if (!out) {
            fs::remove(temp_path, ec);
            return std::unexpected(ManifestError{"Short write to " + temp_path.string()});
        }
    }

    fs::rename(temp_path, manifest_path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return std::unexpected(ManifestError{"Cannot replace " + manifest_path.string() + ": " + ec.message()});
    }
    return {};
}

std::expected<FileManifest, ManifestError> FileManifest::scan(const fs::path& directory,
                                                              const std::vector<std::string>& exclude) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return std::unexpected(ManifestError{"Not a directory: " + directory.string()});
    }

    FileManifest manifest;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(ManifestError{"Cannot scan " + directory.string() + ": " + ec.message()});
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::path relative = it->path().lexically_relative(directory);
        std::error_code entry_ec;

        if (is_excluded(relative, exclude)) {
            if (it->is_directory(entry_ec)) {
                it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(entry_ec)) {
            manifest.files.push_back(relative.generic_string());
        }

        it.increment(ec);
        if (ec) {
            return std::unexpected(ManifestError{"Cannot scan " + directory.string() + ": " + ec.message()});
        }
    }

    manifest.normalize();
    return manifest;
}

// ============================================================================
// 파일 복사 / 설치
// ============================================================================

bool is_safe_relative_path(const std::string& relative_path) {
    if (relative_path.empty()) {
        return false;
    }

    fs::path path(relative_path);
    if (path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        return false;
    }

    for (const auto& component : path.lexically_normal()) {
        if (component == "..") {
            return false;
        }
    }
    return true;
}

std::expected<void, ManifestError> copy_manifest_files(const FileManifest& manifest,
                                                       const fs::path& from,
                                                       const fs::path& to) {
    std::error_code ec;
    fs::create_directories(to, ec);
    if (ec) {
        return std::unexpected(ManifestError{"Cannot create " + to.string() + ": " + ec.message()});
    }

    for (const auto& relative : manifest.files) {
        if (!is_safe_relative_path(relative)) {
            return std::unexpected(ManifestError{"Refusing to copy unsafe path: " + relative});
        }

        const fs::path source = from / relative;
        const fs::path target = to / relative;

        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return std::unexpected(ManifestError{"Cannot create " + target.parent_path().string() +
                                                     ": " + ec.message()});
            }
        }

        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return std::unexpected(ManifestError{"Cannot copy " + source.string() + " to " +
                                                 target.string() + ": " + ec.message()});
        }
    }
    return {};
}

std::expected<std::optional<FileManifest>, ManifestError> load_live_manifest(const fs::path& app_dir) {
    const fs::path manifest_path = app_dir / FileManifest::FILE_NAME;

    std::error_code ec;
    if (!fs::exists(manifest_path, ec)) {
        return std::optional<FileManifest>{};
    }

    auto manifest = FileManifest::load(manifest_path);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }
    return std::optional<FileManifest>(std::move(*manifest));
}

std::expected<FileManifest, ManifestError> resolve_live_manifest(const fs::path& app_dir,
                                                                 const std::vector<std::string>& exclude) {
    auto recorded = load_live_manifest(app_dir);
    if (!recorded) {
        return std::unexpected(recorded.error());
    }
    if (recorded->has_value()) {
        return std::move(**recorded);
    }
    return FileManifest::scan(app_dir, exclude);
}

std::expected<void, ManifestError> install_manifest(const FileManifest& incoming,
                                                    const fs::path& source_dir,
                                                    const fs::path& app_dir) {
    auto previous = load_live_manifest(app_dir);
    if (!previous) {
        return std::unexpected(previous.error());
    }

    if (auto copied = copy_manifest_files(incoming, source_dir, app_dir); !copied) {
        return copied;
    }

    if (previous->has_value()) {
        std::error_code ec;
        for (const auto& relative : (*previous)->files) {
            if (!incoming.contains(relative) && is_safe_relative_path(relative)) {
                fs::remove(app_dir / relative, ec);
                if (ec) {
                    return std::unexpected(ManifestError{"Cannot remove stale file " +
                                                         (app_dir / relative).string() + ": " + ec.message()});
                }
            }
        }
    }

    return incoming.save(app_dir / FileManifest::FILE_NAME);
}

} // namespace updraft
