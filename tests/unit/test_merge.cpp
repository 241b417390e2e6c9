#include <catch2/catch_test_macros.hpp>
#include "core/merge.hpp"

using namespace lockbox;

namespace {

/**
 * Root
 * +-- G1
 * |   +-- E1
 * +-- G2
 * +-- E2
 *
 * Every timestamp is 1 so that later edits are unambiguous.
 */
struct Origin {
    Database db;
    Uuid g1;
    Uuid g2;
    Uuid e1;
    Uuid e2;
};

Entry titled(const char* title, Timestamp at) {
    auto entry = Entry::create(at);
    entry.set(TITLE_FIELD, PlainText{title});
    return entry;
}

Origin make_origin() {
    const Timestamp t(1);
    Origin origin{.db = Database::create(DatabaseConfig{}, t)};

    auto g1 = Group::create("G1", t);
    auto g2 = Group::create("G2", t);
    auto e1 = titled("E1", t);
    auto e2 = titled("E2", t);

    origin.g1 = g1.id;
    origin.g2 = g2.id;
    origin.e1 = e1.id;
    origin.e2 = e2.id;

    g1.add_child(e1);
    origin.db.root.add_child(g1);
    origin.db.root.add_child(g2);
    origin.db.root.add_child(e2);
    return origin;
}

Entry& entry_in(Database& db, const Uuid& id) {
    return *db.root.find_by_id(id)->as_entry();
}

void edit_title(Database& db, const Uuid& id, const char* title, Timestamp at) {
    auto& entry = entry_in(db, id);
    entry.set(TITLE_FIELD, PlainText{title});
    entry.touch(at);
}

} // namespace

TEST_CASE("Deletion wins over a later unsynchronized edit", "[merge][tombstone]") {
    auto origin = make_origin();
    auto x = origin.db;
    auto y = origin.db;

    // X deletes E at t=10; Y, unaware, edits E at t=12.
    REQUIRE(x.delete_by_id(origin.e2, true, Timestamp(10)).has_value());
    edit_title(y, origin.e2, "edited later", Timestamp(12));

    SECTION("merging X into Y removes the edited entry") {
        auto result = merge(y, x);
        REQUIRE(result.is_ok());
        REQUIRE(y.root.find_by_id(origin.e2) == nullptr);
        REQUIRE(y.deleted_objects.timestamp_of(origin.e2) == Timestamp(10));
        REQUIRE(result.unwrap().contains(MergeEventType::EntryDeleted, origin.e2));
    }

    SECTION("merging Y into X does not resurrect it") {
        auto result = merge(x, y);
        REQUIRE(result.is_ok());
        REQUIRE(x.root.find_by_id(origin.e2) == nullptr);
        REQUIRE_FALSE(result.unwrap().has_changes());
    }
}

TEST_CASE("A tombstoned ancestor covers its descendants", "[merge][tombstone]") {
    auto origin = make_origin();
    auto x = origin.db;
    auto y = origin.db;

    REQUIRE(x.delete_by_id(origin.g1, true, Timestamp(10)).has_value());
    edit_title(y, origin.e1, "edited inside deleted group", Timestamp(12));

    auto y_result = merge(y, x);
    REQUIRE(y_result.is_ok());
    REQUIRE(y.root.find_by_id(origin.g1) == nullptr);
    REQUIRE(y.root.find_by_id(origin.e1) == nullptr);
    REQUIRE(y_result.unwrap().contains(MergeEventType::GroupDeleted, origin.g1));

    auto x_result = merge(x, y);
    REQUIRE(x_result.is_ok());
    REQUIRE(x.root.find_by_id(origin.e1) == nullptr);
    REQUIRE(x.root.find_by_id(origin.g1) == nullptr);
}

TEST_CASE("A local tombstone newer than the incoming node keeps it absent", "[merge][tombstone]") {
    auto origin = make_origin();
    auto local = origin.db;
    auto incoming = origin.db;

    REQUIRE(local.delete_by_id(origin.e1, true, Timestamp(50)).has_value());
    edit_title(incoming, origin.e1, "older edit", Timestamp(40));

    REQUIRE(merge(local, incoming).is_ok());
    REQUIRE(local.root.find_by_id(origin.e1) == nullptr);
    REQUIRE(local.deleted_objects.timestamp_of(origin.e1) == Timestamp(50));
}

TEST_CASE("Deletions replicate through merge", "[merge][tombstone]") {
    auto origin = make_origin();
    auto local = origin.db;
    auto remote = origin.db;

    REQUIRE(remote.delete_by_id(origin.e1, true, Timestamp(5)).has_value());
    REQUIRE(remote.delete_by_id(origin.g2, true, Timestamp(6)).has_value());

    auto result = merge(local, remote);
    REQUIRE(result.is_ok());

    const auto& log = result.unwrap();
    REQUIRE(log.contains(MergeEventType::EntryDeleted, origin.e1));
    REQUIRE(log.contains(MergeEventType::GroupDeleted, origin.g2));
    REQUIRE(local.root.find_by_id(origin.e1) == nullptr);
    REQUIRE(local.root.find_by_id(origin.g2) == nullptr);
    REQUIRE(local.deleted_objects == remote.deleted_objects);
    REQUIRE(local.root == remote.root);
}

TEST_CASE("Ledgers are unioned with the latest time per identity", "[merge][tombstone]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    REQUIRE(a.delete_by_id(origin.e2, true, Timestamp(10)).has_value());
    REQUIRE(b.delete_by_id(origin.e2, true, Timestamp(15)).has_value());
    REQUIRE(b.delete_by_id(origin.g2, true, Timestamp(5)).has_value());
    auto forgotten = Uuid::generate();
    b.deleted_objects.record(forgotten, Timestamp(3));

    REQUIRE(merge(a, b).is_ok());

    REQUIRE(a.deleted_objects.size() == 3);
    REQUIRE(a.deleted_objects.timestamp_of(origin.e2) == Timestamp(15));
    REQUIRE(a.deleted_objects.timestamp_of(origin.g2) == Timestamp(5));
    REQUIRE(a.deleted_objects.timestamp_of(forgotten) == Timestamp(3));
    REQUIRE(a.root.find_by_id(origin.g2) == nullptr);
}

TEST_CASE("Unknown incoming nodes are inserted under their parent", "[merge][structure]") {
    auto origin = make_origin();
    auto local = origin.db;
    auto incoming = origin.db;

    auto g3 = Group::create("G3", Timestamp(20));
    auto e3 = titled("E3", Timestamp(20));
    auto e4 = titled("E4", Timestamp(21));
    const Uuid g3_id = g3.id;
    const Uuid e3_id = e3.id;
    const Uuid e4_id = e4.id;

    g3.add_child(e3);
    incoming.root.add_child(g3);
    incoming.root.find_group(origin.g2)->add_child(e4);

    auto result = merge(local, incoming);
    REQUIRE(result.is_ok());

    const auto& log = result.unwrap();
    REQUIRE(log.contains(MergeEventType::GroupCreated, g3_id));
    REQUIRE(log.contains(MergeEventType::EntryCreated, e3_id));
    REQUIRE(log.contains(MergeEventType::EntryCreated, e4_id));
    REQUIRE(log.count(MergeEventType::EntryCreated) == 2);

    REQUIRE(local.parent_of(g3_id) == local.root.id);
    REQUIRE(local.parent_of(e3_id) == g3_id);
    REQUIRE(local.parent_of(e4_id) == origin.g2);
    REQUIRE(local.root.children.back().id() == g3_id);
    REQUIRE_FALSE(local.root.find_duplicate_id().has_value());
}

TEST_CASE("Local child order is kept and new nodes are appended", "[merge][structure]") {
    auto origin = make_origin();
    auto local = origin.db;
    auto incoming = origin.db;

    auto mine = titled("mine", Timestamp(5));
    auto theirs = titled("theirs", Timestamp(6));
    const Uuid mine_id = mine.id;
    const Uuid theirs_id = theirs.id;
    local.root.add_child(mine);
    incoming.root.add_child(theirs);

    REQUIRE(merge(local, incoming).is_ok());

    std::vector<Uuid> order;
    for (const auto& child : local.root.children) {
        order.push_back(child.id());
    }
    REQUIRE(order == std::vector<Uuid>{origin.g1, origin.g2, origin.e2, mine_id, theirs_id});
}

TEST_CASE("Entry content follows the newer side", "[merge][entry]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    edit_title(b, origin.e1, "newer", Timestamp(20));

    SECTION("newer incoming replaces local and keeps the old content as history") {
        auto result = merge(a, b);
        REQUIRE(result.is_ok());
        REQUIRE(result.unwrap().contains(MergeEventType::EntryUpdated, origin.e1));

        const auto& entry = entry_in(a, origin.e1);
        REQUIRE(entry.title() == "newer");
        REQUIRE(entry.updated_at == Timestamp(20));
        REQUIRE(entry.history.size() == 1);
        REQUIRE(entry.history[0].updated_at == Timestamp(1));
        REQUIRE(*entry.history[0].fields.get(TITLE_FIELD) == Value{PlainText{"E1"}});
    }

    SECTION("older incoming is kept as history only") {
        auto result = merge(b, a);
        REQUIRE(result.is_ok());

        const auto& entry = entry_in(b, origin.e1);
        REQUIRE(entry.title() == "newer");
        REQUIRE(entry.history.size() == 1);
        REQUIRE(entry.history[0].updated_at == Timestamp(1));
    }

    SECTION("both directions agree") {
        auto a2 = a;
        auto b2 = b;
        REQUIRE(merge(a2, b).is_ok());
        REQUIRE(merge(b2, a).is_ok());
        REQUIRE(entry_in(a2, origin.e1) == entry_in(b2, origin.e1));
    }
}

TEST_CASE("Entry histories are unioned", "[merge][entry][history]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    auto& theirs = entry_in(b, origin.e1);
    theirs.update_history();
    theirs.set(TITLE_FIELD, PlainText{"B1"});
    theirs.touch(Timestamp(20));
    theirs.update_history();

    edit_title(a, origin.e1, "A1", Timestamp(30));

    auto a2 = a;
    auto b2 = b;
    REQUIRE(merge(a2, b).is_ok());
    REQUIRE(merge(b2, a).is_ok());

    const auto& merged = entry_in(a2, origin.e1);
    REQUIRE(merged.title() == "A1");
    REQUIRE(merged.history.size() == 2);
    REQUIRE(merged.history[0].updated_at == Timestamp(1));
    REQUIRE(merged.history[1].updated_at == Timestamp(20));
    REQUIRE(merged == entry_in(b2, origin.e1));
}

TEST_CASE("Equal timestamps with different content keep local", "[merge][entry]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    edit_title(a, origin.e2, "from a", Timestamp(20));
    edit_title(b, origin.e2, "from b", Timestamp(20));

    auto result = merge(a, b);
    REQUIRE(result.is_ok());
    REQUIRE(entry_in(a, origin.e2).title() == "from a");
    REQUIRE(result.unwrap().warnings.size() == 1);
    REQUIRE_FALSE(result.unwrap().has_changes());
}

TEST_CASE("Equal group timestamps with different names keep local", "[merge][group]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    auto* ours = a.root.find_group(origin.g1);
    ours->name = "Ours";
    ours->touch(Timestamp(20));

    auto* theirs = b.root.find_group(origin.g1);
    theirs->name = "Theirs";
    theirs->notes = "changed too";
    theirs->touch(Timestamp(20));

    b.root.name = "Other root";

    auto result = merge(a, b);
    REQUIRE(result.is_ok());
    REQUIRE(a.root.find_group(origin.g1)->name == "Ours");
    REQUIRE(a.root.find_group(origin.g1)->notes.empty());
    REQUIRE(a.root.name == "Root");
    REQUIRE(result.unwrap().warnings.size() == 2);
    REQUIRE_FALSE(result.unwrap().has_changes());
}

TEST_CASE("Group and database metadata follow the newer side", "[merge][group]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    auto* group = b.root.find_group(origin.g1);
    group->name = "Renamed";
    group->notes = "moved to the new provider";
    group->touch(Timestamp(30));

    b.meta.name = "Team vault";
    b.meta.description = "shared";
    b.meta.name_changed_at = Timestamp(40);

    b.root.name = "Everything";
    b.root.touch(Timestamp(35));

    auto result = merge(a, b);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().contains(MergeEventType::GroupUpdated, origin.g1));
    REQUIRE(result.unwrap().contains(MergeEventType::GroupUpdated, a.root.id));

    REQUIRE(a.root.find_group(origin.g1)->name == "Renamed");
    REQUIRE(a.root.find_group(origin.g1)->notes == "moved to the new provider");
    REQUIRE(a.root.name == "Everything");
    REQUIRE(a.meta.name == "Team vault");
    REQUIRE(a.meta.description == "shared");

    // Children are reconciled on their own, not replaced by the newer group.
    REQUIRE(a.parent_of(origin.e1) == origin.g1);

    auto stale = origin.db;
    REQUIRE(merge(b, stale).is_ok());
    REQUIRE(b.meta.name == "Team vault");
    REQUIRE(b.root.find_group(origin.g1)->name == "Renamed");
}

TEST_CASE("Relocations follow the later location change", "[merge][move]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    REQUIRE(b.move_node(origin.e1, origin.g2, Timestamp(50)).is_ok());

    SECTION("the moved side wins") {
        auto result = merge(a, b);
        REQUIRE(result.is_ok());
        REQUIRE(result.unwrap().contains(MergeEventType::EntryLocationUpdated, origin.e1));
        REQUIRE(a.parent_of(origin.e1) == origin.g2);
        REQUIRE(a.root.find_group(origin.g1)->children.empty());
    }

    SECTION("a stale location does not move it back") {
        REQUIRE(merge(b, a).is_ok());
        REQUIRE(b.parent_of(origin.e1) == origin.g2);
    }

    SECTION("a move away and back only updates the location time") {
        auto c = origin.db;
        REQUIRE(c.move_node(origin.e1, origin.g2, Timestamp(20)).is_ok());
        REQUIRE(c.move_node(origin.e1, origin.g1, Timestamp(30)).is_ok());

        auto result = merge(a, c);
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.unwrap().has_changes());
        REQUIRE(a.parent_of(origin.e1) == origin.g1);
        REQUIRE(entry_in(a, origin.e1) == entry_in(c, origin.e1));
    }

    SECTION("a move into a newly created group") {
        auto g3 = Group::create("G3", Timestamp(60));
        const Uuid g3_id = g3.id;
        b.root.add_child(g3);
        REQUIRE(b.move_node(origin.e2, g3_id, Timestamp(61)).is_ok());

        REQUIRE(merge(a, b).is_ok());
        REQUIRE(a.parent_of(origin.e2) == g3_id);
        REQUIRE(a.parent_of(origin.e1) == origin.g2);
        REQUIRE_FALSE(a.root.find_duplicate_id().has_value());
    }
}

TEST_CASE("Relocations that would form a cycle are skipped", "[merge][move]") {
    auto origin = make_origin();
    auto a = origin.db;
    auto b = origin.db;

    REQUIRE(a.move_node(origin.g1, origin.g2, Timestamp(20)).is_ok());
    REQUIRE(b.move_node(origin.g2, origin.g1, Timestamp(30)).is_ok());

    auto result = merge(a, b);
    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.unwrap().warnings.empty());
    REQUIRE(a.parent_of(origin.g1) == origin.g2);
    REQUIRE(a.parent_of(origin.g2) == a.root.id);
    REQUIRE_FALSE(a.root.find_duplicate_id().has_value());
}

TEST_CASE("Merging a database with itself changes nothing", "[merge][idempotence]") {
    auto origin = make_origin();
    auto db = origin.db;
    REQUIRE(db.delete_by_id(origin.e2, true, Timestamp(3)).has_value());
    edit_title(db, origin.e1, "changed", Timestamp(4));
    entry_in(db, origin.e1).update_history();

    const auto before = db;

    SECTION("with a copy") {
        auto copy = db;
        auto result = merge(db, copy);
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.unwrap().has_changes());
        REQUIRE(result.unwrap().warnings.empty());
        REQUIRE(db == before);
    }

    SECTION("with the same object") {
        auto result = merge(db, db);
        REQUIRE(result.is_ok());
        REQUIRE(db == before);
    }

    SECTION("repeating a merge") {
        auto other = origin.db;
        edit_title(other, origin.e2, "elsewhere", Timestamp(9));
        other.root.add_child(titled("fresh", Timestamp(9)));

        REQUIRE(merge(db, other).is_ok());
        const auto once = db;
        auto again = merge(db, other);
        REQUIRE(again.is_ok());
        REQUIRE_FALSE(again.unwrap().has_changes());
        REQUIRE(db == once);
    }
}

TEST_CASE("A root tombstone is ignored", "[merge][tombstone]") {
    auto origin = make_origin();
    auto local = origin.db;
    auto incoming = origin.db;
    incoming.deleted_objects.record(ROOT_GROUP_ID, Timestamp(99));

    auto result = merge(local, incoming);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().warnings.size() == 1);
    REQUIRE(local.root.id == ROOT_GROUP_ID);
    REQUIRE(local.root.descendant_count() == 4);
    REQUIRE_FALSE(local.deleted_objects.contains(ROOT_GROUP_ID));
}

TEST_CASE("Failed merges leave the local database untouched", "[merge][errors]") {
    auto origin = make_origin();
    auto local = origin.db;
    auto incoming = origin.db;

    // Changes that would apply cleanly on their own.
    edit_title(incoming, origin.e1, "should not land", Timestamp(70));
    REQUIRE(incoming.delete_by_id(origin.g2, true, Timestamp(71)).has_value());

    SECTION("same identity as group and entry") {
        auto entry = Entry::create(Timestamp(2));
        auto group = Group::create("impostor", Timestamp(2));
        group.id = entry.id;
        local.root.add_child(entry);
        incoming.root.add_child(group);

        const auto before = local;
        auto result = merge(local, incoming);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::KindConflict);
        REQUIRE(local == before);
    }

    SECTION("duplicate identity in the incoming tree") {
        incoming.root.add_child(entry_in(incoming, origin.e1));

        const auto before = local;
        auto result = merge(local, incoming);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::PreconditionViolation);
        REQUIRE(local == before);
    }

    SECTION("live node that is also tombstoned") {
        local.deleted_objects.record(origin.e2, Timestamp(5));

        const auto before = local;
        auto result = merge(local, incoming);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::StructuralInconsistency);
        REQUIRE(local == before);
    }
}
