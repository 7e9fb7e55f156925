/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "http_types.h"
#include "core/engine.h"
#include "common/result.h"

#include <QByteArray>
#include <QObject>

namespace PassKey {
namespace Endpoints {
using Shared::Result;

/**
 * @brief Validating side: an Engine plus request middleware
 *
 * The middleware reads the token from one request header (DEFAULT_HEADER_KEY
 * unless changed) and answers
 * - 400 Bad Request, no body, when the header is missing or malformed
 * - 401 Unauthorized, no body, when the code is not in the live window
 * - otherwise whatever the wrapped handler answers
 */
class Server : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *DEFAULT_HEADER_KEY = "token";

    explicit Server(QObject *parent = nullptr);

    /**
     * @brief Applies @p encodedSecret and starts rotation
     * @param context Session cancellation signal
     * @param encodedSecret base32 secret; empty generates one (see Engine::secretGenerated)
     */
    Result<void> start(Core::SessionContext *context, const QString &encodedSecret = QString());

    Core::Engine &engine() { return m_engine; }
    const Core::Engine &engine() const { return m_engine; }

    /**
     * @brief Sets the header the middleware reads; empty restores the default
     */
    Server &setHeaderKey(const QByteArray &headerKey);
    QByteArray headerKey() const { return m_headerKey; }

    /**
     * @brief Validates a header value against the live window
     */
    Result<void> validate(const QByteArray &headerValue) const;

    /**
     * @brief Maps a validation result to the response status
     */
    static Http::Status statusFor(const Result<void> &validation);

    /**
     * @brief Wraps @p next with token validation
     *
     * The returned handler refers to this server, which must outlive it.
     */
    Http::Handler isValid(Http::Handler next) const;

private:
    Core::Engine m_engine;
    QByteArray m_headerKey;
};

} // namespace Endpoints
} // namespace PassKey
