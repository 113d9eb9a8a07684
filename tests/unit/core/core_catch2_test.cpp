#include <catch2/catch_test_macros.hpp>

#include <mediafetch/core/hex.h>
#include <mediafetch/core/item.h>
#include <mediafetch/core/timestamp.h>
#include <mediafetch/core/types.h>

#include <chrono>
#include <string>

using namespace mediafetch;

TEST_CASE("Timestamps format as UTC with microseconds", "[core][timestamp]") {
    const auto tp = parseIso8601("2026-01-01T10:00:00.123456+00:00");
    REQUIRE(tp.has_value());
    CHECK(formatIso8601(*tp) == "2026-01-01T10:00:00.123456+00:00");

    SECTION("offsets are normalized to UTC") {
        auto shifted = parseIso8601("2026-01-01T12:30:00+02:30");
        REQUIRE(shifted.has_value());
        CHECK(formatIso8601(*shifted) == "2026-01-01T10:00:00.000000+00:00");
    }

    SECTION("Z suffix and missing offset are UTC") {
        CHECK(parseIso8601("2026-01-01T10:00:00Z") == parseIso8601("2026-01-01T10:00:00"));
    }

    SECTION("garbage is rejected") {
        CHECK_FALSE(parseIso8601("yesterday").has_value());
        CHECK_FALSE(parseIso8601("2026-13-01T10:00:00Z").has_value());
    }
}

TEST_CASE("Hex helpers", "[core][hex]") {
    auto bytes = fromHex("00FFa5");
    REQUIRE(bytes);
    REQUIRE(bytes.value().size() == 3);
    CHECK(toHexLower(bytes.value()) == "00ffa5");

    CHECK_FALSE(fromHex("abc"));
    CHECK(fromHex("zz").error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Error codes map onto report categories", "[core][errors]") {
    CHECK(isTransient(ErrorCode::Timeout));
    CHECK(isTransient(ErrorCode::NetworkError));
    CHECK(isTransient(ErrorCode::RateLimited));
    CHECK(isTransient(ErrorCode::ServerError));
    CHECK_FALSE(isTransient(ErrorCode::NotFound));
    CHECK_FALSE(isTransient(ErrorCode::TlsVerificationFailed));

    CHECK(categorize(ErrorCode::DecryptionFailure) == ErrorCategory::Structural);
    CHECK(categorize(ErrorCode::ChecksumMismatch) == ErrorCategory::Structural);
    CHECK(categorize(ErrorCode::StorageFull) == ErrorCategory::Resource);
    CHECK(categorize(ErrorCode::OperationCancelled) == ErrorCategory::Cancelled);
    CHECK(std::string(categoryToString(ErrorCategory::Transient)) == "transient");
}

TEST_CASE("Source tags map onto item kinds", "[core][item]") {
    auto playlist = makeItemFromTag("1", "playlist");
    CHECK(playlist.sourceKind == SourceKind::CollectionMember);
    CHECK(sourceTag(playlist.sourceKind, playlist.sourceSubtype) == "playlist");

    auto manual = makeItemFromTag("2", "manual");
    CHECK(manual.sourceKind == SourceKind::Manual);
    CHECK_FALSE(manual.sourceSubtype.has_value());

    auto other = makeItemFromTag("3", "radio");
    CHECK(other.sourceKind == SourceKind::Other);
    CHECK(sourceTag(other.sourceKind, other.sourceSubtype) == "radio");
}
