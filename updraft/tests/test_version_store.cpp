#include <catch2/catch.hpp>

#include "test_support.h"
#include "updraft/version/version_store.h"

#include <nlohmann/json.hpp>

using namespace updraft;
using updraft::testing::TempDir;
using updraft::testing::read_file;
using updraft::testing::write_file;

namespace fs = std::filesystem;

namespace {

using History = std::vector<std::string>;

void write_history(const fs::path& versions_dir, const History& versions) {
    nlohmann::json doc;
    doc["versions"] = versions;
    write_file(versions_dir / VersionStore::HISTORY_FILE_NAME, doc.dump());
}

History read_history(const fs::path& versions_dir) {
    auto doc = nlohmann::json::parse(read_file(versions_dir / VersionStore::HISTORY_FILE_NAME));
    return doc["versions"].get<History>();
}

} // namespace

// -------------------------------------------------------------------------
TEST_CASE("VersionStore: empty history without a file", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    VersionStore store(context, dir / "versions", 5);

    REQUIRE(store.load().has_value());
    REQUIRE(store.size() == 0);
    REQUIRE_FALSE(store.get_current().has_value());
    REQUIRE_FALSE(store.get_previous().has_value());
    REQUIRE(fs::is_directory(dir / "versions"));
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: current and previous follow adoption order", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    VersionStore store(context, dir.path(), 5);
    REQUIRE(store.load().has_value());

    REQUIRE(store.set_current("v1.0.0").has_value());
    REQUIRE(store.get_current() == std::optional<std::string>("v1.0.0"));
    REQUIRE_FALSE(store.get_previous().has_value());

    REQUIRE(store.set_current("v1.1.0").has_value());
    REQUIRE(store.get_current() == std::optional<std::string>("v1.1.0"));
    REQUIRE(store.get_previous() == std::optional<std::string>("v1.0.0"));

    REQUIRE(read_history(dir.path()) == History{"v1.0.0", "v1.1.0"});
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: adopting a known version does not reorder", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    VersionStore store(context, dir.path(), 5);
    REQUIRE(store.load().has_value());

    REQUIRE(store.set_current("a").has_value());
    REQUIRE(store.set_current("b").has_value());
    REQUIRE(store.set_current("a").has_value());

    REQUIRE(store.history() == History{"a", "b"});
    REQUIRE(read_history(dir.path()) == History{"a", "b"});
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: oldest versions are evicted with their directories", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();

    write_history(dir.path(), {"v1.0.0", "v1.1.0", "v1.2.0"});
    write_file(dir / "v1.0.0/app.py", "1.0");
    write_file(dir / "v1.1.0/app.py", "1.1");
    write_file(dir / "v1.2.0/app.py", "1.2");

    VersionStore store(context, dir.path(), 2);

    SECTION("a lowered cap trims on load") {
        REQUIRE(store.load().has_value());
        REQUIRE(store.history() == History{"v1.1.0", "v1.2.0"});
        REQUIRE(read_history(dir.path()) == History{"v1.1.0", "v1.2.0"});
        REQUIRE_FALSE(fs::exists(dir / "v1.0.0"));
        REQUIRE(fs::exists(dir / "v1.1.0"));
    }

    SECTION("adopting past the cap drops the oldest") {
        REQUIRE(store.load().has_value());
        REQUIRE(store.set_current("v1.3.0").has_value());
        REQUIRE(store.history() == History{"v1.2.0", "v1.3.0"});
        REQUIRE(read_history(dir.path()) == History{"v1.2.0", "v1.3.0"});
        REQUIRE_FALSE(fs::exists(dir / "v1.0.0"));
        REQUIRE_FALSE(fs::exists(dir / "v1.1.0"));
        REQUIRE(read_file(dir / "v1.2.0/app.py") == "1.2");
    }
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: history survives a reload", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    {
        VersionStore store(context, dir.path(), 3);
        REQUIRE(store.load().has_value());
        REQUIRE(store.set_current("1.0.0").has_value());
        REQUIRE(store.set_current("1.0.1").has_value());
    }

    VersionStore reloaded(context, dir.path(), 3);
    REQUIRE(reloaded.load().has_value());
    REQUIRE(reloaded.history() == History{"1.0.0", "1.0.1"});
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: unreadable history is reported", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    VersionStore store(context, dir.path(), 3);

    SECTION("not json") {
        write_file(dir / VersionStore::HISTORY_FILE_NAME, "{versions: ");
    }
    SECTION("wrong shape") {
        write_file(dir / VersionStore::HISTORY_FILE_NAME, R"({"versions": "v1"})");
    }
    SECTION("non-string entry") {
        write_file(dir / VersionStore::HISTORY_FILE_NAME, R"({"versions": ["v1", 2]})");
    }

    auto loaded = store.load();
    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error().code == VersionErrorCode::CORRUPT_HISTORY);
    REQUIRE(store.size() == 0);
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: duplicate entries on disk are collapsed", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    write_history(dir.path(), {"v1", "v2", "v1"});

    VersionStore store(context, dir.path(), 5);
    REQUIRE(store.load().has_value());
    REQUIRE(store.history() == History{"v1", "v2"});
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: retire_current removes the failed version", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    VersionStore store(context, dir.path(), 5);
    REQUIRE(store.load().has_value());

    REQUIRE(store.set_current("v1").has_value());
    REQUIRE(store.set_current("v2").has_value());
    write_file(store.version_dir("v2") / "app.py", "broken");

    auto retired = store.retire_current();
    REQUIRE(retired.has_value());
    REQUIRE(*retired == "v2");
    REQUIRE(store.get_current() == std::optional<std::string>("v1"));
    REQUIRE_FALSE(fs::exists(store.version_dir("v2")));
    REQUIRE(read_history(dir.path()) == History{"v1"});

    REQUIRE(store.retire_current().has_value());
    auto empty = store.retire_current();
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().code == VersionErrorCode::NO_CURRENT_VERSION);
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: version directories are sanitized", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    VersionStore store(context, dir.path(), 5);

    REQUIRE(store.version_dir("v1.2.0-rc_1") == dir / "v1.2.0-rc_1");
    REQUIRE(store.version_dir("../../etc") == dir / ".._.._etc");
    REQUIRE(store.version_dir("release 2/beta") == dir / "release_2_beta");
    REQUIRE(store.version_dir("..") == dir / "_..");
    REQUIRE(store.version_dir("") == dir / "_");
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: backup then restore is byte identical", "[version_store]")
{
    TempDir root;
    auto context = updraft::testing::quiet_context();
    const auto app = root / "app";
    const std::string binary("\x00\x01\xff\x7f payload", 12);

    write_file(app / "app.py", "print('v1')\n");
    write_file(app / "assets/blob.bin", binary);
    write_file(app / "logs/application.out", "runtime output");

    VersionStore store(context, root / "versions", 5, {"logs"});
    REQUIRE(store.load().has_value());

    auto no_current = store.backup_current(app);
    REQUIRE_FALSE(no_current.has_value());
    REQUIRE(no_current.error().code == VersionErrorCode::NO_CURRENT_VERSION);

    REQUIRE(store.initialize_from_existing(app, "1.0.0").has_value());
    REQUIRE(store.get_current() == std::optional<std::string>("1.0.0"));
    REQUIRE(fs::exists(app / FileManifest::FILE_NAME));

    auto backup = store.backup_current(app);
    REQUIRE(backup.has_value());
    REQUIRE(backup->files == std::vector<std::string>{"app.py", "assets/blob.bin"});
    REQUIRE_FALSE(fs::exists(store.version_dir("1.0.0") / "logs"));

    // 라이브 디렉토리 훼손
    write_file(app / "app.py", "corrupted");
    fs::remove(app / "assets/blob.bin");

    auto manifest = store.manifest_for("1.0.0");
    REQUIRE(manifest.has_value());
    REQUIRE(install_manifest(*manifest, store.version_dir("1.0.0"), app).has_value());

    REQUIRE(read_file(app / "app.py") == "print('v1')\n");
    REQUIRE(read_file(app / "assets/blob.bin") == binary);
    REQUIRE(read_file(app / "logs/application.out") == "runtime output");
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: initialization happens only once", "[version_store]")
{
    TempDir root;
    auto context = updraft::testing::quiet_context();
    write_file(root / "app/app.py", "v1");

    VersionStore store(context, root / "versions", 5);
    REQUIRE(store.load().has_value());
    REQUIRE(store.initialize_from_existing(root / "app", "1.0.0").has_value());
    REQUIRE(store.initialize_from_existing(root / "app", "9.9.9").has_value());

    REQUIRE(store.history() == History{"1.0.0"});
    REQUIRE_FALSE(fs::exists(store.version_dir("9.9.9")));
}
// -------------------------------------------------------------------------
TEST_CASE("VersionStore: staging is discarded only for unknown versions", "[version_store]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    VersionStore store(context, dir.path(), 5);
    REQUIRE(store.load().has_value());
    REQUIRE(store.set_current("v1").has_value());

    write_file(store.version_dir("v1") / "app.py", "kept");
    write_file(store.version_dir("v2") / "app.py", "staged");

    store.discard_staging("v1");
    store.discard_staging("v2");

    REQUIRE(fs::exists(store.version_dir("v1") / "app.py"));
    REQUIRE_FALSE(fs::exists(store.version_dir("v2")));
}
