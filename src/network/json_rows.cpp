#include "network/json_rows.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

#include <cmath>

namespace studysync::network {

namespace {

// Largest double below which every integer is exact.
constexpr double kMaxExactInteger = 9007199254740992.0;

} // namespace

QJsonValue value_to_json(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return QJsonValue(static_cast<qint64>(*i));
    if (const auto* d = std::get_if<double>(&value)) return QJsonValue(*d);
    if (const auto* s = std::get_if<std::string>(&value)) return QJsonValue(QString::fromStdString(*s));
    return QJsonValue(QJsonValue::Null);
}

Value value_from_json(const QJsonValue& value) {
    switch (value.type()) {
        case QJsonValue::Null:
        case QJsonValue::Undefined:
            return std::monostate{};
        case QJsonValue::Bool:
            return int64_t{value.toBool() ? 1 : 0};
        case QJsonValue::Double: {
            const double d = value.toDouble();
            if (std::trunc(d) == d && std::fabs(d) < kMaxExactInteger) {
                return static_cast<int64_t>(d);
            }
            return d;
        }
        case QJsonValue::String:
            return value.toString().toStdString();
        case QJsonValue::Array:
            return QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact).toStdString();
        case QJsonValue::Object:
            return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact).toStdString();
    }
    return std::monostate{};
}

QJsonObject row_to_json(const Row& row) {
    QJsonObject object;
    for (const auto& [column, value] : row) {
        object.insert(QString::fromStdString(column), value_to_json(value));
    }
    return object;
}

Row row_from_json(const QJsonObject& object) {
    Row row;
    for (auto it = object.begin(); it != object.end(); ++it) {
        row.emplace(it.key().toStdString(), value_from_json(it.value()));
    }
    return row;
}

QJsonArray rows_to_json(const std::vector<Row>& rows) {
    QJsonArray array;
    for (const auto& row : rows) {
        array.append(row_to_json(row));
    }
    return array;
}

Result<std::vector<Row>, Error> rows_from_json(const QByteArray& body) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<std::vector<Row>, Error>::err(
            Error::validation("Malformed response: " + parse_error.errorString().toStdString()));
    }
    if (!doc.isArray()) {
        return Result<std::vector<Row>, Error>::err(Error::validation("Expected a JSON array of rows"));
    }

    std::vector<Row> rows;
    const auto array = doc.array();
    rows.reserve(static_cast<std::size_t>(array.size()));
    for (const auto& item : array) {
        if (!item.isObject()) {
            return Result<std::vector<Row>, Error>::err(Error::validation("Expected a JSON object per row"));
        }
        rows.push_back(row_from_json(item.toObject()));
    }
    return Result<std::vector<Row>, Error>::ok(std::move(rows));
}

} // namespace studysync::network
