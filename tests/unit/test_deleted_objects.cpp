#include <catch2/catch_test_macros.hpp>
#include "core/deleted_objects.hpp"

using namespace lockbox;

TEST_CASE("DeletedObjects keeps one tombstone per identity", "[deleted_objects]") {
    DeletedObjects ledger;
    auto a = Uuid::generate();
    auto b = Uuid::generate();

    REQUIRE(ledger.empty());
    REQUIRE(ledger.record(a, Timestamp(10)));
    REQUIRE(ledger.record(b, Timestamp(5)));
    REQUIRE(ledger.size() == 2);

    SECTION("re-recording is idempotent") {
        REQUIRE_FALSE(ledger.record(a, Timestamp(10)));
        REQUIRE(ledger.size() == 2);
    }

    SECTION("later deletion raises the timestamp") {
        REQUIRE(ledger.record(a, Timestamp(20)));
        REQUIRE(ledger.timestamp_of(a) == Timestamp(20));
        REQUIRE(ledger.size() == 2);
    }

    SECTION("earlier deletion is ignored") {
        REQUIRE_FALSE(ledger.record(a, Timestamp(1)));
        REQUIRE(ledger.timestamp_of(a) == Timestamp(10));
    }

    SECTION("lookup") {
        REQUIRE(ledger.contains(a));
        REQUIRE_FALSE(ledger.contains(Uuid::generate()));
        REQUIRE_FALSE(ledger.timestamp_of(Uuid::generate()).has_value());
    }

    SECTION("objects keep first-recorded order") {
        ledger.record(a, Timestamp(50));
        REQUIRE(ledger.objects()[0].id == a);
        REQUIRE(ledger.objects()[1].id == b);
    }
}

TEST_CASE("DeletedObjects::merge_from is a union with maximum times", "[deleted_objects]") {
    auto shared = Uuid::generate();
    auto only_left = Uuid::generate();
    auto only_right = Uuid::generate();

    DeletedObjects left;
    left.record(shared, Timestamp(10));
    left.record(only_left, Timestamp(3));

    DeletedObjects right;
    right.record(shared, Timestamp(12));
    right.record(only_right, Timestamp(7));

    auto merged = left;
    merged.merge_from(right);

    REQUIRE(merged.size() == 3);
    REQUIRE(merged.timestamp_of(shared) == Timestamp(12));
    REQUIRE(merged.timestamp_of(only_left) == Timestamp(3));
    REQUIRE(merged.timestamp_of(only_right) == Timestamp(7));

    auto again = merged;
    again.merge_from(right);
    REQUIRE(again == merged);
}
