#pragma once

#include "core/result.hpp"
#include "core/row.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <vector>

namespace studysync::network {

[[nodiscard]] QJsonValue value_to_json(const Value& value);

/**
 * Integral numbers become int64, other numbers double, booleans 0/1.
 * Objects and arrays are kept as compact JSON text.
 */
[[nodiscard]] Value value_from_json(const QJsonValue& value);

[[nodiscard]] QJsonObject row_to_json(const Row& row);
[[nodiscard]] Row row_from_json(const QJsonObject& object);

[[nodiscard]] QJsonArray rows_to_json(const std::vector<Row>& rows);

/**
 * Parse a response body holding a JSON array of objects.
 */
[[nodiscard]] Result<std::vector<Row>, Error> rows_from_json(const QByteArray& body);

} // namespace studysync::network
