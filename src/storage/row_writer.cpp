#include "storage/row_writer.hpp"

#include <vector>

namespace studysync::storage {

Result<void, Error> insert_row(Database& db, const std::string& table, const Row& row) {
    std::string columns;
    std::string placeholders;
    std::vector<Value> values;
    values.reserve(row.size());
    for (const auto& [column, value] : row) {
        if (!values.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += column;
        placeholders += "?";
        values.push_back(value);
    }
    return db.execute("INSERT INTO " + table + " (" + columns + ") VALUES (" + placeholders + ");",
                      values);
}

Result<void, Error> update_row(Database& db, const std::string& table, const Row& row) {
    auto id = row.find("id");
    if (id == row.end() || is_null(id->second)) {
        return Result<void, Error>::err(Error::validation("Row to update has no id"));
    }

    std::string assignments;
    std::vector<Value> values;
    for (const auto& [column, value] : row) {
        if (column == "id") continue;
        if (!assignments.empty()) assignments += ", ";
        assignments += column + " = ?";
        values.push_back(value);
    }
    if (assignments.empty()) {
        return Result<void, Error>::ok();
    }
    values.push_back(id->second);

    auto result = db.execute("UPDATE " + table + " SET " + assignments + " WHERE id = ?;", values);
    if (result.is_err()) return result;
    if (db.changes() == 0) {
        return Result<void, Error>::err(Error::validation("No " + table + " row with id " +
                                                          get_text(row, "id").value_or("")));
    }
    return Result<void, Error>::ok();
}

} // namespace studysync::storage
