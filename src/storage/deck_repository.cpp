#include "storage/deck_repository.hpp"

#include "storage/row_writer.hpp"
#include <set>

namespace studysync::storage {

namespace {

constexpr const char* kSelectDecks =
    "SELECT id, user_id, parent_id, name, description, created_at, modified_at FROM decks";

Result<void, Error> remove_recursive(Database& db, const std::string& id,
                                     std::set<std::string>& visited) {
    if (!visited.insert(id).second) {
        return Result<void, Error>::ok();
    }

    std::vector<std::string> children;
    auto listed = db.query("SELECT id FROM decks WHERE parent_id = ?;", {Value{id}},
        [&children](const Statement& stmt) { children.push_back(stmt.column_text(0)); });
    if (listed.is_err()) return listed;

    auto cards = db.execute("DELETE FROM cards WHERE deck_id = ?;", {Value{id}});
    if (cards.is_err()) return cards;

    for (const auto& child : children) {
        auto result = remove_recursive(db, child, visited);
        if (result.is_err()) return result;
    }

    return db.execute("DELETE FROM decks WHERE id = ?;", {Value{id}});
}

} // namespace

Result<std::optional<Deck>, Error> DeckRepository::get(const Uuid& id) {
    auto decks = store_.get_all<Deck>(std::string(kSelectDecks) + " WHERE id = ?;",
                                      {Value{id.to_string()}}, deck_from_row);
    if (decks.is_err()) {
        return Result<std::optional<Deck>, Error>::err(decks.unwrap_err());
    }
    auto& list = decks.unwrap();
    if (list.empty()) {
        return Result<std::optional<Deck>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Deck>, Error>::ok(std::move(list.front()));
}

Result<std::vector<Deck>, Error> DeckRepository::get_all() {
    return store_.get_all<Deck>(std::string(kSelectDecks) + " ORDER BY name COLLATE NOCASE;",
                                {}, deck_from_row);
}

Result<std::vector<Deck>, Error> DeckRepository::get_children(const Uuid& parent_id) {
    return store_.get_all<Deck>(
        std::string(kSelectDecks) + " WHERE parent_id = ? ORDER BY name COLLATE NOCASE;",
        {Value{parent_id.to_string()}}, deck_from_row);
}

Result<void, Error> DeckRepository::insert(const Deck& deck) {
    auto name = validate_deck_name(deck.name);
    if (name.is_err()) {
        return Result<void, Error>::err(name.unwrap_err());
    }
    auto row = deck_to_row(deck);
    row["name"] = name.unwrap();
    return store_.write_transaction([&row](Database& db) {
        return insert_row(db, "decks", row);
    });
}

Result<void, Error> DeckRepository::update(const Deck& deck) {
    auto name = validate_deck_name(deck.name);
    if (name.is_err()) {
        return Result<void, Error>::err(name.unwrap_err());
    }
    auto row = deck_to_row(deck);
    row["name"] = name.unwrap();
    return store_.write_transaction([&row](Database& db) {
        return update_row(db, "decks", row);
    });
}

Result<void, Error> DeckRepository::remove(const Uuid& id) {
    const auto key = id.to_string();
    return store_.write_transaction([&key](Database& db) {
        std::set<std::string> visited;
        return remove_recursive(db, key, visited);
    });
}

} // namespace studysync::storage
