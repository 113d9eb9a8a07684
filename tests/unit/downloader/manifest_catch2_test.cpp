#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <mediafetch/downloader/manifest_json.hpp>

#include "../../support/fake_collaborators.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <string>

using namespace mediafetch;
using namespace mediafetch::downloader;
using mediafetch::test_support::splitIntoManifest;
using mediafetch::test_support::TempDirScope;
using mediafetch::test_support::writeTextFile;

TEST_CASE("validateManifest accepts contiguous chunk lists in any order", "[downloader][manifest]") {
    auto m = splitIntoManifest(std::string(35, 'x'), 10);
    REQUIRE(validateManifest(m));

    std::swap(m.chunks[0], m.chunks[3]);
    CHECK(validateManifest(m));
}

TEST_CASE("validateManifest rejects structural violations", "[downloader][manifest]") {
    auto m = splitIntoManifest(std::string(40, 'x'), 10);

    SECTION("empty") { m.chunks.clear(); }
    SECTION("duplicate index") { m.chunks[1].index = 0; }
    SECTION("index gap") { m.chunks[3].index = 7; }
    SECTION("overlap") { m.chunks[2].range.offset = 15; }
    SECTION("gap between ranges") { m.chunks[1].range.length = 5; }
    SECTION("total size mismatch") { m.totalSize = 39; }
    SECTION("missing url") { m.chunks[0].locator.url.clear(); }

    auto r = validateManifest(m);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ManifestInvalid);
}

TEST_CASE("Manifest documents derive offsets and sizes", "[downloader][manifest]") {
    auto doc = parseManifestDocument(R"({
        "item": {"id": 4711, "sourceType": "playlist", "sourceId": "pl-1", "sourceName": "Mix"},
        "sha256": "ABCDEF",
        "encryption": {"scheme": "aes-ctr", "key": "000102030405060708090a0b0c0d0e0f",
                       "iv": "0102030405060708"},
        "chunks": [
            {"index": 1, "url": "https://cdn/b", "length": 7},
            {"index": 0, "url": "https://cdn/a", "length": 5, "range": true},
            {"index": 2, "url": "https://cdn/c", "length": 3}
        ]
    })");
    REQUIRE(doc);
    const auto& m = doc.value().manifest;

    REQUIRE(doc.value().item.has_value());
    CHECK(doc.value().item->itemId == "4711");
    CHECK(doc.value().item->sourceKind == SourceKind::CollectionMember);
    CHECK(doc.value().item->sourceSubtype == std::optional<std::string>("playlist"));

    CHECK(m.totalSize == 15);
    CHECK(m.sha256 == std::optional<std::string>("abcdef"));
    CHECK(m.keys.scheme == CipherScheme::AesCtrStream);
    CHECK(m.keys.key.size() == 16);
    CHECK(m.keys.iv.size() == 8);

    REQUIRE(m.chunks.size() == 3);
    CHECK(m.chunks[0].index == 1);
    CHECK(m.chunks[0].range.offset == 5);
    CHECK(m.chunks[1].range.offset == 0);
    CHECK(m.chunks[1].locator.useRangeHeader);
    CHECK(m.chunks[2].range.offset == 12);
    CHECK(validateManifest(m));
}

TEST_CASE("Manifest documents reject malformed input", "[downloader][manifest]") {
    const char* text = GENERATE(
        "not json", R"([1,2])", R"({"chunks": 3})", R"({"chunks": [{"url": "u"}]})",
        R"({"encryption": {"scheme": "rot13"}, "chunks": []})",
        R"({"encryption": {"scheme": "aes-cbc", "key": "zz"}, "chunks": []})");
    auto doc = parseManifestDocument(text);
    REQUIRE_FALSE(doc);
    CHECK(doc.error().code == ErrorCode::ManifestInvalid);
}

TEST_CASE("JsonManifestResolver reads per-item files from a directory", "[downloader][manifest]") {
    auto tmp = TempDirScope::unique_under("mf-manifest");
    writeTextFile(tmp / "t1.json",
                  R"({"chunks": [{"url": "https://cdn/t1", "length": 4}], "totalSize": 4})");

    JsonManifestResolver resolver(tmp.path());
    auto found = resolver.resolve(makeItemFromTag("t1", "manual"));
    REQUIRE(found);
    CHECK(found.value().chunks.size() == 1);
    CHECK(found.value().totalSize == 4);

    auto missing = resolver.resolve(makeItemFromTag("t2", "manual"));
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::ResolutionFailed);
}
