#include <catch2/catch.hpp>

#include "test_support.h"
#include "updraft/version/file_manifest.h"

using namespace updraft;
using updraft::testing::TempDir;
using updraft::testing::read_file;
using updraft::testing::write_file;

namespace fs = std::filesystem;

// -------------------------------------------------------------------------
TEST_CASE("FileManifest: scan skips hidden entries and excluded components", "[manifest]")
{
    TempDir dir;
    write_file(dir / "app.py", "print('hi')\n");
    write_file(dir / "lib/util.py", "X = 1\n");
    write_file(dir / "data/cache.db", "cache");
    write_file(dir / "logs/application.out", "out");
    write_file(dir / "lib/__pycache__/util.cpython-311.pyc", "pyc");
    write_file(dir / "weather.log", "log");
    write_file(dir / ".env", "SECRET=1");
    write_file(dir / ".git/HEAD", "ref");
    write_file(dir / FileManifest::FILE_NAME, "{}");

    auto manifest = FileManifest::scan(dir.path(), {"data", "logs", "__pycache__", "*.log"});
    REQUIRE(manifest.has_value());
    REQUIRE(manifest->files == std::vector<std::string>{"app.py", "lib/util.py"});
}
// -------------------------------------------------------------------------
TEST_CASE("FileManifest: scan of a missing directory fails", "[manifest]")
{
    TempDir dir;
    auto manifest = FileManifest::scan(dir / "absent");
    REQUIRE_FALSE(manifest.has_value());
}
// -------------------------------------------------------------------------
TEST_CASE("FileManifest: json parsing rejects unsafe entries", "[manifest]")
{
    auto ok = FileManifest::from_json(R"({"version": "v2", "files": ["b.py", "a.py", "b.py", "./lib/c.py"]})");
    REQUIRE(ok.has_value());
    REQUIRE(ok->version == "v2");
    REQUIRE(ok->files == std::vector<std::string>{"a.py", "b.py", "lib/c.py"});

    REQUIRE_FALSE(FileManifest::from_json(R"({"files": ["../etc/passwd"]})").has_value());
    REQUIRE_FALSE(FileManifest::from_json(R"({"files": ["/etc/passwd"]})").has_value());
    REQUIRE_FALSE(FileManifest::from_json(R"({"files": [42]})").has_value());
    REQUIRE_FALSE(FileManifest::from_json(R"({"version": "v2"})").has_value());
    REQUIRE_FALSE(FileManifest::from_json("not json").has_value());

    REQUIRE(is_safe_relative_path("lib/a/../b.py"));
    REQUIRE_FALSE(is_safe_relative_path("lib/../../b.py"));
    REQUIRE_FALSE(is_safe_relative_path(""));
}
// -------------------------------------------------------------------------
TEST_CASE("FileManifest: save and load", "[manifest]")
{
    TempDir dir;
    FileManifest manifest;
    manifest.version = "v1.0.0";
    manifest.files = {"app.py", "config/settings.json"};

    REQUIRE(manifest.save(dir / "nested/manifest.json").has_value());

    auto loaded = FileManifest::load(dir / "nested/manifest.json");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->version == "v1.0.0");
    REQUIRE(loaded->files == manifest.files);

    REQUIRE_FALSE(FileManifest::load(dir / "missing.json").has_value());
}
// -------------------------------------------------------------------------
TEST_CASE("FileManifest: install replaces recorded files and keeps unmanaged ones", "[manifest]")
{
    TempDir root;
    const auto app = root / "app";
    const auto v1 = root / "v1";
    const auto v2 = root / "v2";

    write_file(v1 / "app.py", "v1");
    write_file(v1 / "old_helper.py", "helper");
    write_file(v2 / "app.py", "v2");
    write_file(v2 / "lib/new.py", "new");
    write_file(app / "data/readings.csv", "1,2,3");

    FileManifest first{"v1", {"app.py", "old_helper.py"}};
    FileManifest second{"v2", {"app.py", "lib/new.py"}};

    REQUIRE(install_manifest(first, v1, app).has_value());
    REQUIRE(read_file(app / "app.py") == "v1");
    REQUIRE(fs::exists(app / "old_helper.py"));

    auto live = load_live_manifest(app);
    REQUIRE(live.has_value());
    REQUIRE(live->has_value());
    REQUIRE((*live)->version == "v1");

    REQUIRE(install_manifest(second, v2, app).has_value());
    REQUIRE(read_file(app / "app.py") == "v2");
    REQUIRE(read_file(app / "lib/new.py") == "new");
    REQUIRE_FALSE(fs::exists(app / "old_helper.py"));
    REQUIRE(read_file(app / "data/readings.csv") == "1,2,3");

    auto resolved = resolve_live_manifest(app, {"data"});
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->version == "v2");
}
// -------------------------------------------------------------------------
TEST_CASE("FileManifest: install without a recorded manifest deletes nothing", "[manifest]")
{
    TempDir root;
    const auto app = root / "app";
    write_file(app / "app.py", "hand installed");
    write_file(app / "extra.py", "keep me");
    write_file(root / "src/app.py", "managed");

    REQUIRE(install_manifest(FileManifest{"v1", {"app.py"}}, root / "src", app).has_value());
    REQUIRE(read_file(app / "app.py") == "managed");
    REQUIRE(read_file(app / "extra.py") == "keep me");
}
// -------------------------------------------------------------------------
TEST_CASE("FileManifest: copying a missing source file fails", "[manifest]")
{
    TempDir root;
    write_file(root / "src/app.py", "x");

    auto copied = copy_manifest_files(FileManifest{"v1", {"app.py", "gone.py"}}, root / "src", root / "dst");
    REQUIRE_FALSE(copied.has_value());
    REQUIRE(copied.error().message.find("gone.py") != std::string::npos);
}
