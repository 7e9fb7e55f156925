/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pkgen_options.h"
#include "core/secret_store.h"
#include "core/logging_categories.h"

#include <QDir>
#include <QFile>
#include <KLocalizedString>

namespace PassKey {
namespace Pkgen {
using Shared::ErrorCode;

QString readHomeSecret()
{
    QFile file(QDir::home().filePath(QString::fromLatin1(HOME_SECRET_FILE)));
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }

    const QByteArray head = file.read(Core::SecretStore::ENCODED_SECRET_LENGTH);
    qCDebug(EndpointLog) << "Read secret from" << file.fileName();
    return QString::fromLatin1(head).trimmed();
}

Result<Options> resolveOptions(const QStringList &positional,
                               const QString &envSecret,
                               const QString &envInterval,
                               const QString &homeSecret)
{
    Options options;

    options.secret = envSecret;
    if (options.secret.isEmpty()) {
        options.secret = positional.isEmpty() ? homeSecret : positional.first();
    }

    QString intervalText = envInterval;
    QString origin = QStringLiteral("INTERVAL");
    if (intervalText.isEmpty() && positional.size() > 1) {
        intervalText = positional.at(1);
        origin = i18n("Interval argument");
    }

    if (!intervalText.isEmpty()) {
        bool ok = false;
        const qint64 seconds = intervalText.trimmed().toLongLong(&ok);
        if (!ok || seconds < 0) {
            return Result<Options>::error(ErrorCode::InvalidInterval,
                                          i18n("%1 must be a non-negative number of seconds, got \"%2\"",
                                               origin, intervalText));
        }
        options.interval = std::chrono::seconds(seconds);
    }

    return Result<Options>::success(options);
}

} // namespace Pkgen
} // namespace PassKey
