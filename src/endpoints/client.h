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
#include <optional>

class QNetworkRequest;

namespace PassKey {
namespace Endpoints {
using Shared::Result;

/**
 * @brief Issuing side: an Engine that stamps outgoing requests
 *
 * Every stamp encodes the window's current code with fresh padding, so two
 * requests in the same interval still carry different header text.
 */
class Client : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *DEFAULT_HEADER_KEY = "token";

    explicit Client(QObject *parent = nullptr);

    /**
     * @brief Applies @p encodedSecret and starts rotation
     * @param encodedSecret base32 secret; empty generates one
     */
    Result<void> start(Core::SessionContext *context, const QString &encodedSecret = QString());

    Core::Engine &engine() { return m_engine; }
    const Core::Engine &engine() const { return m_engine; }

    /**
     * @brief Sets the header to stamp; nullopt or empty selects the default
     */
    Client &setHeaderKey(const std::optional<QByteArray> &headerKey);
    QByteArray headerKey() const { return m_headerKey; }

    /**
     * @brief Transport token for the current code
     */
    QByteArray headerValue() const;

    void setHeader(QNetworkRequest &request) const;
    void setHeader(Http::Request &request) const;

private:
    Core::Engine m_engine;
    QByteArray m_headerKey;
};

} // namespace Endpoints
} // namespace PassKey
