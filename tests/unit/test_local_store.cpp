#include <catch2/catch_test_macros.hpp>
#include "storage/local_store.hpp"
#include "core/deck.hpp"

using namespace studysync;
using namespace studysync::storage;

namespace {

std::unique_ptr<LocalStore> open_store() {
    auto store = LocalStore::open_memory();
    REQUIRE(store.is_ok());
    return std::move(store).unwrap();
}

Result<void, Error> insert_deck(LocalStore& store, const std::string& id, const std::string& name) {
    return store.execute(
        "INSERT INTO decks (id, name, created_at, modified_at) VALUES (?, ?, 'c', 'm');",
        {Value{id}, Value{name}});
}

} // namespace

TEST_CASE("Watches re-run after commits to their tables", "[local_store][watch]") {
    auto store = open_store();
    std::vector<size_t> emitted;

    auto id = store->watch("SELECT id FROM decks;", {}, {"decks"},
                           [&emitted](const std::vector<Row>& rows) { emitted.push_back(rows.size()); });

    // Initial emission
    REQUIRE(emitted == std::vector<size_t>({0}));

    REQUIRE(insert_deck(*store, "d1", "One").is_ok());
    REQUIRE(emitted == std::vector<size_t>({0, 1}));

    SECTION("writes to other tables do not re-run the query") {
        REQUIRE(store->set_checkpoint("decks", "2024-01-01T00:00:00.000Z").is_ok());
        REQUIRE(emitted.size() == 2);
    }

    SECTION("a transaction emits once after commit") {
        auto result = store->write_transaction([](Database& db) -> Result<void, Error> {
            auto a = db.execute(
                "INSERT INTO decks (id, name, created_at, modified_at) VALUES ('d2', 'Two', 'c', 'm');");
            if (a.is_err()) return a;
            return db.execute(
                "INSERT INTO decks (id, name, created_at, modified_at) VALUES ('d3', 'Three', 'c', 'm');");
        });
        REQUIRE(result.is_ok());
        REQUIRE(emitted == std::vector<size_t>({0, 1, 3}));
    }

    SECTION("a rolled back transaction emits nothing") {
        auto result = store->write_transaction([](Database& db) -> Result<void, Error> {
            auto a = db.execute(
                "INSERT INTO decks (id, name, created_at, modified_at) VALUES ('d2', 'Two', 'c', 'm');");
            if (a.is_err()) return a;
            return Result<void, Error>::err(Error::validation("stop"));
        });
        REQUIRE(result.is_err());
        REQUIRE(emitted.size() == 2);
        REQUIRE(store->get_rows("SELECT id FROM decks;").unwrap().size() == 1);
    }

    SECTION("unwatch stops emissions") {
        store->unwatch(id);
        REQUIRE(insert_deck(*store, "d2", "Two").is_ok());
        REQUIRE(emitted.size() == 2);
    }
}

TEST_CASE("Mutation listeners fire after logged writes", "[local_store]") {
    auto store = open_store();
    int calls = 0;
    auto id = store->add_mutation_listener([&calls]() { ++calls; });

    REQUIRE(insert_deck(*store, "d1", "One").is_ok());
    REQUIRE(calls == 1);

    // Checkpoints are not logged
    REQUIRE(store->set_checkpoint("decks", "x").is_ok());
    REQUIRE(calls == 1);

    store->remove_mutation_listener(id);
    REQUIRE(insert_deck(*store, "d2", "Two").is_ok());
    REQUIRE(calls == 1);
}

TEST_CASE("Mutation log batches", "[local_store][mutation_log]") {
    auto store = open_store();
    REQUIRE(store->pending_count().unwrap() == 0);
    REQUIRE(store->get_mutation_batch().unwrap().empty());

    REQUIRE(insert_deck(*store, "d1", "One").is_ok());
    REQUIRE(store->execute("UPDATE decks SET name = 'Uno' WHERE id = 'd1';").is_ok());
    REQUIRE(store->execute("DELETE FROM decks WHERE id = 'd1';").is_ok());
    REQUIRE(store->pending_count().unwrap() == 3);
    REQUIRE(store->has_pending("decks", "d1").unwrap());
    REQUIRE_FALSE(store->has_pending("cards", "d1").unwrap());

    auto batch = store->get_mutation_batch().unwrap();
    const auto& ops = batch.operations();
    REQUIRE(ops.size() == 3);
    REQUIRE(ops[0].kind == OpKind::Put);
    REQUIRE(get_text(ops[0].data, "name") == "One");
    REQUIRE(ops[1].kind == OpKind::Patch);
    REQUIRE(get_text(ops[1].data, "name") == "Uno");
    REQUIRE(get_text(ops[1].data, "id") == "d1");
    REQUIRE_FALSE(ops[1].data.contains("created_at"));
    REQUIRE(ops[2].kind == OpKind::Delete);
    REQUIRE(ops[2].data.empty());
    REQUIRE(ops[0].position < ops[1].position);
    REQUIRE(ops[0].describe() == "PUT:decks:d1");

    SECTION("completing keeps operations logged after the snapshot") {
        REQUIRE(insert_deck(*store, "d2", "Two").is_ok());
        REQUIRE(batch.complete().is_ok());
        auto rest = store->get_mutation_batch().unwrap();
        REQUIRE(rest.operations().size() == 1);
        REQUIRE(rest.operations()[0].record_id == "d2");
    }

    SECTION("single operations can be removed") {
        REQUIRE(store->remove_operation(ops[1].position).is_ok());
        REQUIRE(store->pending_count().unwrap() == 2);
    }

    SECTION("limit caps the snapshot") {
        REQUIRE(store->get_mutation_batch(2).unwrap().operations().size() == 2);
    }
}

TEST_CASE("Remote rows are applied without being logged", "[local_store][download]") {
    auto store = open_store();
    auto deck = create_deck(Uuid::generate(), Uuid::generate(), "Remote");
    auto row = deck_to_row(deck);
    row["server_only"] = std::string("ignored");

    auto applied = store->apply_remote("decks", {row});
    REQUIRE(applied.unwrap() == 1);
    REQUIRE(store->pending_count().unwrap() == 0);

    auto rows = store->get_rows("SELECT name FROM decks WHERE id = ?;", {Value{deck.id.to_string()}}).unwrap();
    REQUIRE(get_text(rows.front(), "name") == "Remote");

    SECTION("an existing row is updated in place") {
        row["name"] = std::string("Renamed");
        REQUIRE(store->apply_remote("decks", {row}).unwrap() == 1);
        rows = store->get_rows("SELECT name FROM decks;").unwrap();
        REQUIRE(rows.size() == 1);
        REQUIRE(get_text(rows.front(), "name") == "Renamed");
    }

    SECTION("rows with unsent local edits are skipped") {
        REQUIRE(store->execute("UPDATE decks SET name = 'Local edit' WHERE id = ?;",
                               {Value{deck.id.to_string()}}).is_ok());
        row["name"] = std::string("Server edit");
        REQUIRE(store->apply_remote("decks", {row}).unwrap() == 0);
        rows = store->get_rows("SELECT name FROM decks;").unwrap();
        REQUIRE(get_text(rows.front(), "name") == "Local edit");
    }

    SECTION("capture is re-enabled afterwards") {
        REQUIRE(insert_deck(*store, "local", "Local").is_ok());
        REQUIRE(store->pending_count().unwrap() == 1);
    }

    SECTION("unknown tables are rejected") {
        REQUIRE(store->apply_remote("secrets", {row}).unwrap_err().kind == ErrorKind::Validation);
    }
}

TEST_CASE("Download checkpoints", "[local_store][download]") {
    auto store = open_store();
    REQUIRE_FALSE(store->checkpoint("cards").unwrap().has_value());

    REQUIRE(store->set_checkpoint("cards", "2024-01-01T00:00:00.000Z").is_ok());
    REQUIRE(store->set_checkpoint("cards", "2024-02-01T00:00:00.000Z").is_ok());
    REQUIRE(store->checkpoint("cards").unwrap() == std::optional<std::string>("2024-02-01T00:00:00.000Z"));
    REQUIRE_FALSE(store->checkpoint("decks").unwrap().has_value());
}

TEST_CASE("A closed store reports errors", "[local_store]") {
    auto store = open_store();
    store->close();
    REQUIRE_FALSE(store->is_open());
    REQUIRE(store->get_rows("SELECT 1;").is_err());
}
