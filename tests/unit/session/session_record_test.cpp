// =============================================================================
// SessionRecord JSON Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>

#include "SessionRecord.h"

using namespace bhvd;

namespace {

SessionRecord makeRecord() {
    SessionRecord record;
    record.id = "1700000000123";
    record.startedAt = std::chrono::system_clock::from_time_t(1'700'000'000);
    record.elapsedSeconds = 1200;
    record.completed = true;
    record.source = SessionSource::Tag;
    record.syncState = {SyncStatus::Failed, 2};
    return record;
}

} // namespace

TEST_CASE("SessionRecord serializes with ISO-8601 timestamps", "[session][record]") {
    const ofJson json = sessionRecordToJson(makeRecord());
    CHECK(json["id"] == "1700000000123");
    CHECK(json["startedAt"] == "2023-11-14T22:13:20Z");
    CHECK(json["elapsedSeconds"] == 1200);
    CHECK(json["completed"] == true);
    CHECK(json["source"] == "tag");
    CHECK(json["syncState"] == "failed");
    CHECK(json["retryCount"] == 2);

    const auto parsed = sessionRecordFromJson(json);
    REQUIRE(parsed.has_value());
    CHECK(parsed->startedAt == makeRecord().startedAt);
    CHECK(parsed->syncState.retryCount == 2);
    CHECK(parsed->source == SessionSource::Tag);
}

TEST_CASE("SessionRecord accepts epoch seconds for startedAt", "[session][record]") {
    auto json = sessionRecordToJson(makeRecord());
    json["startedAt"] = 1'700'000'000;
    const auto parsed = sessionRecordFromJson(json);
    REQUIRE(parsed.has_value());
    CHECK(parsed->startedAt == makeRecord().startedAt);
}

TEST_CASE("SessionRecord rejects malformed entries", "[session][record]") {
    const ofJson valid = sessionRecordToJson(makeRecord());

    SECTION("missing id") {
        auto json = valid;
        json.erase("id");
        CHECK_FALSE(sessionRecordFromJson(json).has_value());
    }
    SECTION("negative elapsed") {
        auto json = valid;
        json["elapsedSeconds"] = -1;
        CHECK_FALSE(sessionRecordFromJson(json).has_value());
    }
    SECTION("bad timestamp") {
        auto json = valid;
        json["startedAt"] = "yesterday";
        CHECK_FALSE(sessionRecordFromJson(json).has_value());
    }
    SECTION("unknown sync state") {
        auto json = valid;
        json["syncState"] = "lost";
        CHECK_FALSE(sessionRecordFromJson(json).has_value());
    }
    SECTION("mistyped optional fields") {
        auto json = valid;
        SECTION("source") { json["source"] = 7; }
        SECTION("syncState") { json["syncState"] = true; }
        SECTION("retryCount as string") { json["retryCount"] = "3"; }
        SECTION("negative retryCount") { json["retryCount"] = -1; }
        CHECK_FALSE(sessionRecordFromJson(json).has_value());
    }
    SECTION("not an object") {
        CHECK_FALSE(sessionRecordFromJson(ofJson::array()).has_value());
    }
}

TEST_CASE("SessionSource names", "[session][record]") {
    CHECK(sessionSourceToString(SessionSource::Manual) == "manual");
    CHECK(sessionSourceToString(SessionSource::Tag) == "tag");
    CHECK(sessionSourceFromString("NFC") == SessionSource::Tag);
    CHECK_FALSE(sessionSourceFromString("watch").has_value());
}
