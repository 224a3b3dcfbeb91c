#include "network/rest_backend.hpp"

#include "network/json_rows.hpp"
#include "sync/logging.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QStringList>

namespace studysync::network {

namespace {

constexpr int kTransferTimeoutMs = 30000;

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

Error transport_error(QNetworkReply::NetworkError code, const QString& message) {
    switch (code) {
        case QNetworkReply::AuthenticationRequiredError:
        case QNetworkReply::ContentAccessDenied:
            return Error::auth(message.toStdString(), static_cast<int>(code));
        default:
            return Error::network(message.toStdString(), static_cast<int>(code));
    }
}

// PostgREST errors carry a "message" field; fall back to the raw body.
std::string error_message(const QByteArray& body, const QString& fallback) {
    const auto doc = QJsonDocument::fromJson(body);
    if (doc.isObject()) {
        const auto obj = doc.object();
        for (const auto* key : {"message", "error_description", "msg", "error"}) {
            const auto value = obj.value(QLatin1String(key)).toString();
            if (!value.isEmpty()) return value.toStdString();
        }
    }
    if (!body.isEmpty()) return QString::fromUtf8(body).left(200).toStdString();
    return fallback.toStdString();
}

} // namespace

Result<QByteArray, Error> read_reply(QNetworkReply* reply) {
    const auto status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const auto body = reply->readAll();

    if (status >= 400) {
        return Result<QByteArray, Error>::err(
            Error::from_http_status(status, error_message(body, reply->errorString())));
    }
    if (reply->error() != QNetworkReply::NoError) {
        return Result<QByteArray, Error>::err(transport_error(reply->error(), reply->errorString()));
    }
    return Result<QByteArray, Error>::ok(body);
}

RestBackend::RestBackend(sync::BackendConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config)) {}

RestBackend::~RestBackend() = default;

// ============================================================================
// HTTP plumbing
// ============================================================================

QUrl RestBackend::table_url(const std::string& table, const QUrlQuery& query) const {
    QUrl url(config_.endpoint + QStringLiteral("/rest/v1/") + q(table));
    url.setQuery(query);
    return url;
}

QNetworkRequest RestBackend::make_request(const QUrl& url) const {
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("Accept", "application/json");
    request.setRawHeader("apikey", config_.api_key.toUtf8());
    const auto bearer = access_token_.isEmpty() ? config_.api_key : access_token_;
    request.setRawHeader("Authorization", "Bearer " + bearer.toUtf8());
    request.setTransferTimeout(kTransferTimeoutMs);
    return request;
}

void RestBackend::send(const QByteArray& verb, const QNetworkRequest& request, const QByteArray& body,
                       ReplyHandler handler) {
    qCDebug(studysyncBackendLog) << verb << request.url().toString(QUrl::RemoveUserInfo);
    QNetworkReply* reply = body.isEmpty() && verb == "GET"
        ? manager_.get(request)
        : manager_.sendCustomRequest(request, verb, body);

    connect(reply, &QNetworkReply::finished, this, [reply, verb, handler = std::move(handler)]() {
        auto result = read_reply(reply);
        if (result.is_err()) {
            qCWarning(studysyncBackendLog) << verb << reply->url().path() << "failed:"
                                           << q(result.unwrap_err().message)
                                           << "status=" << result.unwrap_err().code;
        }
        reply->deleteLater();
        handler(std::move(result));
    });
}

Result<void, Error> RestBackend::require_session() const {
    if (!config_.is_configured()) {
        return Result<void, Error>::err(Error::auth("Sync backend is not configured"));
    }
    return Result<void, Error>::ok();
}

QUrlQuery RestBackend::select_query(const sync::SelectFilter& filter) {
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("select"), QStringLiteral("*"));
    switch (filter.kind) {
        case sync::SelectFilter::Kind::ByIds: {
            QStringList ids;
            for (const auto& id : filter.ids) ids << q(id);
            query.addQueryItem(QStringLiteral("id"), QStringLiteral("in.(%1)").arg(ids.join(',')));
            break;
        }
        case sync::SelectFilter::Kind::ModifiedSince:
            if (!filter.since.empty()) {
                query.addQueryItem(q(filter.column), QStringLiteral("gt.") + q(filter.since));
            }
            query.addQueryItem(QStringLiteral("order"), q(filter.column) + QStringLiteral(".asc"));
            break;
    }
    return query;
}

// ============================================================================
// RemoteBackend
// ============================================================================

void RestBackend::fetch_credentials(CredentialsCallback done) {
    if (auto ready = require_session(); ready.is_err()) {
        done(Result<sync::Credentials, Error>::err(ready.unwrap_err()));
        return;
    }
    if (config_.refresh_token.isEmpty()) {
        done(Result<sync::Credentials, Error>::err(Error::auth("Not signed in")));
        return;
    }

    QUrl url(config_.endpoint + QStringLiteral("/auth/v1/token"));
    url.setQuery(QStringLiteral("grant_type=refresh_token"));
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("apikey", config_.api_key.toUtf8());
    request.setTransferTimeout(kTransferTimeoutMs);

    QJsonObject body;
    body.insert(QStringLiteral("refresh_token"), config_.refresh_token);

    QPointer<RestBackend> self(this);
    send("POST", request, QJsonDocument(body).toJson(QJsonDocument::Compact),
        [self, done = std::move(done)](Result<QByteArray, Error> reply) {
            if (!self) return;
            if (reply.is_err()) {
                done(Result<sync::Credentials, Error>::err(reply.unwrap_err()));
                return;
            }
            const auto doc = QJsonDocument::fromJson(reply.unwrap());
            const auto obj = doc.object();
            const auto access = obj.value(QStringLiteral("access_token")).toString();
            if (access.isEmpty()) {
                done(Result<sync::Credentials, Error>::err(Error::auth("Session response had no access token")));
                return;
            }

            self->access_token_ = access;
            const auto refresh = obj.value(QStringLiteral("refresh_token")).toString();
            if (!refresh.isEmpty() && refresh != self->config_.refresh_token) {
                self->config_.refresh_token = refresh;
                emit self->refreshTokenChanged(refresh);
            }
            const auto user_id = obj.value(QStringLiteral("user")).toObject().value(QStringLiteral("id")).toString();
            if (!user_id.isEmpty()) {
                self->config_.account_id = user_id;
            }

            done(Result<sync::Credentials, Error>::ok(sync::Credentials{
                .endpoint = self->config_.endpoint.toStdString(),
                .token = access.toStdString(),
                .account_id = self->config_.account_id.toStdString()
            }));
        });
}

void RestBackend::select(const std::string& table, const sync::SelectFilter& filter, RowsCallback done) {
    if (filter.kind == sync::SelectFilter::Kind::ByIds && filter.ids.empty()) {
        done(Result<std::vector<Row>, Error>::ok({}));
        return;
    }
    send("GET", make_request(table_url(table, select_query(filter))), {},
        [done = std::move(done)](Result<QByteArray, Error> reply) {
            if (reply.is_err()) {
                done(Result<std::vector<Row>, Error>::err(reply.unwrap_err()));
                return;
            }
            done(rows_from_json(reply.unwrap()));
        });
}

void RestBackend::upsert_batch(const std::string& table, std::vector<Row> rows, DoneCallback done) {
    if (rows.empty()) {
        done(Result<void, Error>::ok());
        return;
    }
    auto request = make_request(table_url(table, {}));
    request.setRawHeader("Prefer", "resolution=merge-duplicates,return=minimal");
    const auto body = QJsonDocument(rows_to_json(rows)).toJson(QJsonDocument::Compact);

    send("POST", request, body, [done = std::move(done)](Result<QByteArray, Error> reply) {
        if (reply.is_err()) {
            done(Result<void, Error>::err(reply.unwrap_err()));
            return;
        }
        done(Result<void, Error>::ok());
    });
}

void RestBackend::update(const std::string& table, const std::string& id, Row fields, DoneCallback done) {
    fields.erase("id");
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("id"), QStringLiteral("eq.") + q(id));
    auto request = make_request(table_url(table, query));
    request.setRawHeader("Prefer", "return=minimal");
    const auto body = QJsonDocument(row_to_json(fields)).toJson(QJsonDocument::Compact);

    send("PATCH", request, body, [done = std::move(done)](Result<QByteArray, Error> reply) {
        if (reply.is_err()) {
            done(Result<void, Error>::err(reply.unwrap_err()));
            return;
        }
        done(Result<void, Error>::ok());
    });
}

void RestBackend::remove(const std::string& table, const std::string& id, DoneCallback done) {
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("id"), QStringLiteral("eq.") + q(id));

    send("DELETE", make_request(table_url(table, query)), {},
        [done = std::move(done)](Result<QByteArray, Error> reply) {
            if (reply.is_err()) {
                done(Result<void, Error>::err(reply.unwrap_err()));
                return;
            }
            done(Result<void, Error>::ok());
        });
}

} // namespace studysync::network
