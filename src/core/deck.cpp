#include "core/deck.hpp"

#include <cctype>

namespace studysync {

Result<std::string, Error> validate_deck_name(std::string_view name) {
    size_t begin = 0;
    size_t end = name.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(name[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(name[end - 1]))) --end;
    if (begin == end) {
        return Result<std::string, Error>::err(Error::validation("Deck name cannot be empty"));
    }
    return Result<std::string, Error>::ok(std::string(name.substr(begin, end - begin)));
}

Row deck_to_row(const Deck& deck) {
    return Row{
        {"id", deck.id.to_string()},
        {"user_id", deck.user_id.to_string()},
        {"parent_id", deck.parent_id ? Value{deck.parent_id->to_string()} : Value{}},
        {"name", deck.name},
        {"description", deck.description},
        {"created_at", deck.created_at.to_iso_string()},
        {"modified_at", deck.modified_at.to_iso_string()},
    };
}

Result<Deck, Error> deck_from_row(const Row& row) {
    auto id = get_uuid(row, "id");
    if (!id) {
        return Result<Deck, Error>::err(Error::validation("Deck row has no valid id"));
    }

    const auto now = Timestamp::now();
    return Result<Deck, Error>::ok(Deck{
        .id = *id,
        .user_id = get_uuid(row, "user_id").value_or(Uuid{}),
        .parent_id = get_uuid(row, "parent_id"),
        .name = get_text(row, "name").value_or(""),
        .description = get_text(row, "description").value_or(""),
        .created_at = get_timestamp(row, "created_at").value_or(now),
        .modified_at = get_timestamp(row, "modified_at").value_or(now)
    });
}

} // namespace studysync
