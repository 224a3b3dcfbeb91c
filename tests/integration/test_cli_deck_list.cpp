#include <catch2/catch_test_macros.hpp>

#include "cli/deck_list.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace studysync;
using namespace studysync::cli;

namespace {

constexpr int64_t kDay = 86'400'000;
const Uuid kUser = Uuid::generate();

Card card(std::optional<Uuid> deck_id, LearningState state, Timestamp next_review) {
    auto c = create_card(Uuid::generate(), kUser, deck_id, "q", "a");
    c.memory.state = state;
    c.memory.next_review = next_review;
    return c;
}

struct Library {
    Timestamp now = Timestamp::now();
    Deck parent = create_deck(Uuid::generate(), kUser, "Spanish", {}, std::nullopt);
    Deck child = create_deck(Uuid::generate(), kUser, "Verbs", {}, parent.id);
    std::vector<Card> cards{
        card(parent.id, LearningState::New, now),
        card(parent.id, LearningState::Review, Timestamp(now.millis() + kDay)),
        card(child.id, LearningState::Review, Timestamp(now.millis() - kDay)),
        card(std::nullopt, LearningState::Review, Timestamp(now.millis() - kDay)),
    };
    std::vector<DeckNode> roots = build_deck_tree({parent, child}, cards, now);
};

} // namespace

TEST_CASE("Deck list prints an indented tree with subtree counts", "[cli]") {
    Library lib;

    const auto text = format_deck_tree(lib.roots, lib.cards);

    REQUIRE(text == QStringLiteral("- Spanish [due 2, new 1, cards 3]\n"
                                   "  - Verbs [due 1, new 0, cards 1]\n"
                                   "Unfiled cards: 1\n"));
}

TEST_CASE("Deck list options", "[cli]") {
    Library lib;

    SECTION("ids are appended") {
        DeckListOptions options;
        options.includeIds = true;
        options.includeUnfiled = false;
        const auto text = format_deck_tree(lib.roots, lib.cards, options);
        const auto expected = QStringLiteral("- Spanish [due 2, new 1, cards 3] (%1)\n")
                                  .arg(QString::fromStdString(lib.parent.id.to_string()));
        REQUIRE(text.startsWith(expected));
        REQUIRE_FALSE(text.contains(QStringLiteral("Unfiled")));
    }

    SECTION("nothing to show") {
        REQUIRE(format_deck_tree({}, {}).isEmpty());
    }
}

TEST_CASE("Deck list JSON mirrors the tree", "[cli]") {
    Library lib;

    DeckListOptions options;
    options.includeIds = true;
    const auto json = format_deck_tree_json(lib.roots, lib.cards, lib.now, options);
    REQUIRE(json.endsWith(QLatin1Char('\n')));

    const auto doc = QJsonDocument::fromJson(json.toUtf8());
    REQUIRE(doc.isObject());
    const auto decks = doc.object().value(QStringLiteral("decks")).toArray();
    REQUIRE(decks.size() == 1);

    const auto spanish = decks.at(0).toObject();
    REQUIRE(spanish.value(QStringLiteral("deckId")).toString().toStdString() == lib.parent.id.to_string());
    REQUIRE(spanish.value(QStringLiteral("name")).toString() == QStringLiteral("Spanish"));
    REQUIRE(spanish.value(QStringLiteral("due")).toInt() == 2);
    REQUIRE(spanish.value(QStringLiteral("new")).toInt() == 1);
    REQUIRE(spanish.value(QStringLiteral("cards")).toInt() == 3);

    const auto children = spanish.value(QStringLiteral("children")).toArray();
    REQUIRE(children.size() == 1);
    REQUIRE(children.at(0).toObject().value(QStringLiteral("name")).toString() == QStringLiteral("Verbs"));
    REQUIRE(children.at(0).toObject().value(QStringLiteral("children")).toArray().isEmpty());

    const auto unfiled = doc.object().value(QStringLiteral("unfiled")).toObject();
    REQUIRE(unfiled.value(QStringLiteral("cards")).toInt() == 1);
    REQUIRE(unfiled.value(QStringLiteral("due")).toInt() == 1);
}

TEST_CASE("Status report lists pending work, checkpoints and errors", "[cli]") {
    StatusReport report;
    report.pending.push_back(PendingOperation{
        .position = 1, .kind = OpKind::Put, .table = "cards", .record_id = "c1", .data = {}});
    report.pending.push_back(PendingOperation{
        .position = 2, .kind = OpKind::Delete, .table = "decks", .record_id = "d1", .data = {}});
    report.checkpoints["cards"] = std::string("2024-03-01T10:00:00.000Z");
    report.checkpoints["decks"] = std::nullopt;

    SyncError error;
    error.operation = "PATCH:cards:c2";
    error.message = "Invalid deck";
    error.timestamp = Timestamp(0);
    error.retryable = false;
    report.errors.push_back(error);

    const auto text = format_status(report);

    REQUIRE(text == QStringLiteral("Pending operations: 2\n"
                                   "  PUT:cards:c1\n"
                                   "  DELETE:decks:d1\n"
                                   "Checkpoints:\n"
                                   "  cards: 2024-03-01T10:00:00.000Z\n"
                                   "  decks: never\n"
                                   "Errors: 1\n"
                                   "  1970-01-01T00:00:00.000Z PATCH:cards:c2 (not retryable): Invalid deck\n"));
}

TEST_CASE("Status report without errors omits the error section", "[cli]") {
    const auto text = format_status(StatusReport{});
    REQUIRE(text == QStringLiteral("Pending operations: 0\nCheckpoints:\n"));
}
