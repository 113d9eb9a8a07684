// LedgerStore: atomic replace, corruption quarantine and legacy migration.

#include <catch2/catch_test_macros.hpp>

#include <mediafetch/core/timestamp.h>
#include <mediafetch/ledger/ledger.hpp>

#include <nlohmann/json.hpp>

#include "../../support/temp_dir_scope.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace mediafetch;
using namespace mediafetch::ledger;
using mediafetch::test_support::readTextFile;
using mediafetch::test_support::TempDirScope;
using mediafetch::test_support::writeTextFile;

namespace {

LedgerEntry makeEntry(const std::string& id, const std::string& tag) {
    auto item = makeItemFromTag(id, tag, std::string("src-1"), std::string("Label"));
    LedgerEntry e;
    e.itemId = item.itemId;
    e.sourceKind = item.sourceKind;
    e.sourceSubtype = item.sourceSubtype;
    e.sourceId = item.sourceId;
    e.sourceLabel = item.sourceLabel;
    e.completedAt = *parseIso8601("2026-01-01T10:00:00.000000+00:00");
    return e;
}

} // namespace

TEST_CASE("LedgerStore reports a missing file without creating it", "[ledger][store]") {
    auto tmp = TempDirScope::unique_under("mf-ledger-store");
    LedgerStore store(tmp / "history.json");

    auto loaded = store.load();
    REQUIRE(loaded);
    CHECK(loaded.value().status == LoadStatus::Missing);
    CHECK(loaded.value().snapshot.entries.empty());
    CHECK(loaded.value().snapshot.settings.dedupEnabled);
    CHECK_FALSE(fs::exists(tmp / "history.json"));
}

TEST_CASE("LedgerStore save then load preserves entries and settings", "[ledger][store]") {
    auto tmp = TempDirScope::unique_under("mf-ledger-store");
    LedgerStore store(tmp / "history.json", LedgerStore::Options{false, {}});

    LedgerSnapshot snap;
    snap.settings.dedupEnabled = false;
    snap.entries["t1"] = makeEntry("t1", "playlist");
    snap.entries["t2"] = makeEntry("t2", "manual");
    REQUIRE(store.save(snap));
    REQUIRE(snap.lastUpdated.has_value());

    auto loaded = store.load();
    REQUIRE(loaded);
    const auto& out = loaded.value();
    CHECK(out.status == LoadStatus::Loaded);
    CHECK_FALSE(out.snapshot.settings.dedupEnabled);
    REQUIRE(out.snapshot.entries.size() == 2);
    const auto& t1 = out.snapshot.entries.at("t1");
    CHECK(t1.sourceKind == SourceKind::CollectionMember);
    CHECK(t1.sourceTag() == "playlist");
    CHECK(t1.sourceId == std::optional<std::string>("src-1"));
    CHECK(t1.sourceLabel == std::optional<std::string>("Label"));
    CHECK(formatIso8601(t1.completedAt) == "2026-01-01T10:00:00.000000+00:00");

    auto doc = json::parse(readTextFile(tmp / "history.json"));
    CHECK(doc["schema_version"] == kSchemaVersion);
    CHECK(doc["settings"]["dedup_enabled"] == false);
    CHECK(doc["tracks"]["t2"]["sourceType"] == "manual");
    CHECK(doc.contains("last_updated"));
}

TEST_CASE("LedgerStore quarantines a corrupt file byte for byte", "[ledger][store]") {
    auto tmp = TempDirScope::unique_under("mf-ledger-store");
    const auto path = tmp / "history.json";
    const std::string garbage = "{ \"tracks\": { broken";
    writeTextFile(path, garbage);

    LedgerStore store(path);
    auto loaded = store.load();
    REQUIRE(loaded);
    CHECK(loaded.value().status == LoadStatus::Recovered);
    CHECK(loaded.value().snapshot.entries.empty());
    REQUIRE(loaded.value().backupPath.has_value());
    CHECK(*loaded.value().backupPath == store.backupPath());
    CHECK(readTextFile(store.backupPath()) == garbage);
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("LedgerStore drops invalid entries and keeps the rest", "[ledger][store]") {
    auto tmp = TempDirScope::unique_under("mf-ledger-store");
    const auto path = tmp / "history.json";
    writeTextFile(path, R"({"schema_version":1,"settings":{"dedup_enabled":true},
                           "tracks":{
                             "t1":{"sourceType":"manual",
                                   "downloadDate":"2026-01-01T10:00:00.000000+00:00"},
                             "t2":{"sourceType":"manual"},
                             "t3":{"sourceType":"album","downloadDate":"yesterday"},
                             "t4":{"sourceId":"x"}}})");

    LedgerStore store(path);
    auto loaded = store.load();
    REQUIRE(loaded);
    CHECK(loaded.value().status == LoadStatus::Migrated);
    CHECK_FALSE(loaded.value().backupPath.has_value());
    CHECK_FALSE(fs::exists(store.backupPath()));
    CHECK(fs::exists(path));
    const auto& entries = loaded.value().snapshot.entries;
    REQUIRE(entries.size() == 1);
    CHECK(entries.count("t1") == 1);
}

TEST_CASE("Strict decoding rejects a document with an invalid entry", "[ledger][codec]") {
    const std::string text = R"({"settings":{"dedup_enabled":true},
                                 "tracks":{"t1":{"sourceType":"manual",
                                                 "downloadDate":"2026-01-01T10:00:00+00:00"},
                                           "t2":{"sourceType":"manual"}}})";

    auto strict = decodeSnapshot(text);
    REQUIRE_FALSE(strict);
    CHECK(strict.error().code == ErrorCode::ValidationError);

    auto lenient = decodeSnapshot(text, EntryPolicy::SkipInvalid);
    REQUIRE(lenient);
    CHECK(lenient.value().snapshot.entries.size() == 1);
    CHECK(lenient.value().rejected.size() == 1);
    CHECK_FALSE(lenient.value().legacy);
}

TEST_CASE("LedgerStore abandoned commit leaves previous file intact", "[ledger][store]") {
    auto tmp = TempDirScope::unique_under("mf-ledger-store");
    const auto path = tmp / "history.json";

    {
        LedgerStore store(path, LedgerStore::Options{false, {}});
        LedgerSnapshot snap;
        snap.entries["t1"] = makeEntry("t1", "album");
        REQUIRE(store.save(snap));
    }
    const auto before = readTextFile(path);

    bool gateCalled = false;
    LedgerStore::Options opts;
    opts.fsync = false;
    opts.commitGate = [&](const fs::path& tempFile) {
        gateCalled = true;
        CHECK(fs::exists(tempFile));
        CHECK(tempFile.parent_path() == path.parent_path());
        return false;
    };
    LedgerStore store(path, opts);
    LedgerSnapshot snap;
    snap.entries["t1"] = makeEntry("t1", "album");
    snap.entries["t2"] = makeEntry("t2", "album");
    auto saved = store.save(snap);
    CHECK_FALSE(saved);
    CHECK(gateCalled);

    CHECK(readTextFile(path) == before);
    auto decoded = decodeSnapshot(readTextFile(path));
    REQUIRE(decoded);
    CHECK(decoded.value().snapshot.entries.size() == 1);

    // No temporary files are left behind
    std::size_t files = 0;
    for (const auto& e : fs::directory_iterator(tmp.path())) {
        (void)e;
        ++files;
    }
    CHECK(files == 1);
}

TEST_CASE("Ledger codec migrates legacy layouts", "[ledger][codec]") {
    SECTION("entries at the root with underscore metadata") {
        auto decoded = decodeSnapshot(R"({
            "_schema_version": 1,
            "_last_updated": "2025-05-01T08:00:00Z",
            "t1": {"sourceType": "playlist", "sourceId": "pl", "sourceName": "Road",
                   "downloadDate": "2025-05-01T08:00:00Z"}
        })");
        REQUIRE(decoded);
        CHECK(decoded.value().legacy);
        CHECK_FALSE(decoded.value().hasDedupSetting);
        const auto& snap = decoded.value().snapshot;
        REQUIRE(snap.entries.count("t1") == 1);
        CHECK(snap.entries.at("t1").sourceTag() == "playlist");
        CHECK(snap.settings.dedupEnabled);
        CHECK(snap.schemaVersion == kSchemaVersion);
    }

    SECTION("preventDuplicates setting") {
        auto decoded = decodeSnapshot(R"({"settings": {"preventDuplicates": false}, "tracks": {}})");
        REQUIRE(decoded);
        CHECK(decoded.value().legacy);
        CHECK(decoded.value().hasDedupSetting);
        CHECK_FALSE(decoded.value().snapshot.settings.dedupEnabled);
    }

    SECTION("non-object document is corrupt") {
        auto decoded = decodeSnapshot("[1, 2, 3]");
        REQUIRE_FALSE(decoded);
        CHECK(decoded.error().code == ErrorCode::CorruptedData);
    }
}

TEST_CASE("LedgerStore load flags legacy files as migrated", "[ledger][store]") {
    auto tmp = TempDirScope::unique_under("mf-ledger-store");
    const auto path = tmp / "history.json";
    writeTextFile(path, R"({"t9": {"sourceType": "manual", "downloadDate": "2025-01-02T03:04:05Z"}})");

    LedgerStore store(path);
    auto loaded = store.load();
    REQUIRE(loaded);
    CHECK(loaded.value().status == LoadStatus::Migrated);
    CHECK(loaded.value().snapshot.entries.count("t9") == 1);
}
