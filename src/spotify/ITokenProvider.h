#pragma once

#include <QString>
#include <functional>
#include <optional>

#include "../core/PlaybackError.h"

// Source of valid Spotify access tokens.  OAuth and token refresh live
// outside this library; the backends only ever ask for "a valid token now".
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;

    // token is empty whenever error is set
    using TokenCallback = std::function<void(const QString& token,
                                             const std::optional<PlaybackError>& error)>;

    virtual void fetchAccessToken(TokenCallback callback) = 0;
};

// Hands out one fixed token (command line or environment).
class StaticTokenProvider : public ITokenProvider {
public:
    explicit StaticTokenProvider(const QString& token = QString()) : m_token(token) {}

    void setToken(const QString& token) { m_token = token; }
    QString token() const { return m_token; }

    void fetchAccessToken(TokenCallback callback) override
    {
        if (m_token.isEmpty()) {
            callback(QString(), PlaybackError::notAuthenticated(QStringLiteral("no access token configured")));
            return;
        }
        callback(m_token, std::nullopt);
    }

private:
    QString m_token;
};
