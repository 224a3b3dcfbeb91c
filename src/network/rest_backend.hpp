#pragma once

#include "sync/config.hpp"
#include "sync/remote_backend.hpp"
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>
#include <QUrlQuery>
#include <functional>

class QNetworkReply;
class QNetworkRequest;

namespace studysync::network {

/**
 * RestBackend - RemoteBackend over a PostgREST-style HTTP API.
 *
 * Tables live under <endpoint>/rest/v1/<table>; sessions come from
 * <endpoint>/auth/v1/token. Transport failures are network errors, HTTP
 * failures are classified by status code.
 */
class RestBackend : public QObject, public sync::RemoteBackend {
    Q_OBJECT

public:
    explicit RestBackend(sync::BackendConfig config, QObject* parent = nullptr);
    ~RestBackend() override;

    void fetch_credentials(CredentialsCallback done) override;
    void select(const std::string& table, const sync::SelectFilter& filter, RowsCallback done) override;
    void upsert_batch(const std::string& table, std::vector<Row> rows, DoneCallback done) override;
    void update(const std::string& table, const std::string& id, Row fields, DoneCallback done) override;
    void remove(const std::string& table, const std::string& id, DoneCallback done) override;

    /**
     * Refresh token handed out with the last session, to be persisted.
     */
    [[nodiscard]] const QString& refresh_token() const noexcept { return config_.refresh_token; }

    [[nodiscard]] static QUrlQuery select_query(const sync::SelectFilter& filter);

signals:
    void refreshTokenChanged(const QString& token);

private:
    using ReplyHandler = std::function<void(Result<QByteArray, Error>)>;

    [[nodiscard]] QUrl table_url(const std::string& table, const QUrlQuery& query) const;
    [[nodiscard]] QNetworkRequest make_request(const QUrl& url) const;
    void send(const QByteArray& verb, const QNetworkRequest& request, const QByteArray& body,
              ReplyHandler handler);
    [[nodiscard]] Result<void, Error> require_session() const;

    sync::BackendConfig config_;
    QNetworkAccessManager manager_;
    QString access_token_;
};

/**
 * Turn a finished reply into its body or a classified error.
 */
[[nodiscard]] Result<QByteArray, Error> read_reply(QNetworkReply* reply);

} // namespace studysync::network
