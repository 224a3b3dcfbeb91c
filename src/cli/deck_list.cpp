#include "cli/deck_list.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace studysync::cli {

namespace {

[[nodiscard]] QString render_id_suffix(const Uuid& id, bool includeIds) {
    return includeIds ? (QStringLiteral(" (") + QString::fromStdString(id.to_string()) + QStringLiteral(")"))
                      : QString{};
}

[[nodiscard]] QString render_deck_line(const DeckNode& node, int depth, bool includeIds) {
    const auto indent = QString(depth * 2, QLatin1Char(' '));
    return indent + QStringLiteral("- ") + QString::fromStdString(node.deck.name)
        + QStringLiteral(" [due %1, new %2, cards %3]")
              .arg(node.total_due_count())
              .arg(node.total_new_count())
              .arg(node.total_card_count())
        + render_id_suffix(node.deck.id, includeIds);
}

void render_subtree(QStringList& out, const DeckNode& node, int depth, bool includeIds) {
    out.append(render_deck_line(node, depth, includeIds));
    for (const auto& child : node.children) {
        render_subtree(out, child, depth + 1, includeIds);
    }
}

[[nodiscard]] QJsonObject deck_to_json(const DeckNode& node, bool includeIds) {
    QJsonObject obj;
    if (includeIds) {
        obj.insert(QStringLiteral("deckId"), QString::fromStdString(node.deck.id.to_string()));
    }
    obj.insert(QStringLiteral("name"), QString::fromStdString(node.deck.name));
    obj.insert(QStringLiteral("due"), static_cast<qint64>(node.total_due_count()));
    obj.insert(QStringLiteral("new"), static_cast<qint64>(node.total_new_count()));
    obj.insert(QStringLiteral("cards"), static_cast<qint64>(node.total_card_count()));

    QJsonArray children;
    for (const auto& child : node.children) {
        children.append(deck_to_json(child, includeIds));
    }
    obj.insert(QStringLiteral("children"), children);
    return obj;
}

// Cards whose deck is not in the tree, including those with no deck at all.
[[nodiscard]] std::vector<Card> unfiled_cards(const std::vector<DeckNode>& roots, const std::vector<Card>& cards) {
    std::vector<Card> out;
    for (const auto& card : cards) {
        if (!card.deck_id || !find_deck(roots, *card.deck_id)) {
            out.push_back(card);
        }
    }
    return out;
}

} // namespace

QString format_deck_tree(const std::vector<DeckNode>& roots,
                         const std::vector<Card>& cards,
                         const DeckListOptions& options) {
    QStringList out;
    for (const auto& root : roots) {
        render_subtree(out, root, 0, options.includeIds);
    }

    if (options.includeUnfiled) {
        const auto unfiled = unfiled_cards(roots, cards);
        if (!unfiled.empty()) {
            out.append(QStringLiteral("Unfiled cards: %1").arg(unfiled.size()));
        }
    }

    if (out.isEmpty()) {
        return {};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_deck_tree_json(const std::vector<DeckNode>& roots,
                              const std::vector<Card>& cards,
                              Timestamp now,
                              const DeckListOptions& options) {
    QJsonArray decksJson;
    for (const auto& root : roots) {
        decksJson.append(deck_to_json(root, options.includeIds));
    }

    QJsonObject root;
    root.insert(QStringLiteral("decks"), decksJson);

    if (options.includeUnfiled) {
        const auto unfiled = unfiled_cards(roots, cards);
        if (!unfiled.empty()) {
            QJsonObject unfiledObj;
            unfiledObj.insert(QStringLiteral("cards"), static_cast<qint64>(unfiled.size()));
            unfiledObj.insert(QStringLiteral("due"), static_cast<qint64>(count_due(unfiled, now)));
            root.insert(QStringLiteral("unfiled"), unfiledObj);
        }
    }

    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact)) + QLatin1Char('\n');
}

QString format_status(const StatusReport& report) {
    QStringList out;
    out.append(QStringLiteral("Pending operations: %1").arg(report.pending.size()));
    for (const auto& op : report.pending) {
        out.append(QStringLiteral("  ") + QString::fromStdString(op.describe()));
    }

    out.append(QStringLiteral("Checkpoints:"));
    for (const auto& [table, value] : report.checkpoints) {
        out.append(QStringLiteral("  %1: %2")
                       .arg(QString::fromStdString(table),
                            value ? QString::fromStdString(*value) : QStringLiteral("never")));
    }

    if (!report.errors.empty()) {
        out.append(QStringLiteral("Errors: %1").arg(report.errors.size()));
        for (const auto& error : report.errors) {
            out.append(QStringLiteral("  %1 %2%3: %4")
                           .arg(QString::fromStdString(error.timestamp.to_iso_string()),
                                QString::fromStdString(error.operation),
                                error.retryable ? QString{} : QStringLiteral(" (not retryable)"),
                                QString::fromStdString(error.message)));
        }
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace studysync::cli
