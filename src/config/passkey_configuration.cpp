/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "passkey_configuration.h"
#include "core/logging_categories.h"

#include <QDir>
#include <QFile>
#include <QStandardPaths>
#include <KLocalizedString>

namespace PassKey {
namespace Config {
using namespace PassKey::Shared;

namespace {

Result<std::chrono::seconds> parseSeconds(const QString &text, const QString &origin)
{
    bool ok = false;
    const qint64 seconds = text.trimmed().toLongLong(&ok);
    if (!ok || seconds < 0) {
        return Result<std::chrono::seconds>::error(
            ErrorCode::InvalidInterval,
            i18n("%1 must be a non-negative number of seconds, got \"%2\"", origin, text));
    }
    return Result<std::chrono::seconds>::success(std::chrono::seconds(seconds));
}

} // namespace

PassKeyConfiguration::PassKeyConfiguration(const QString &configName, QObject *parent)
    : QObject(parent)
    , m_config(KSharedConfig::openConfig(configName, KConfig::SimpleConfig))
    , m_configGroup(m_config->group(QString::fromLatin1(ConfigKeys::GENERAL_GROUP)))
    , m_fileWatcher(new QFileSystemWatcher(this))
{
    if (QDir::isAbsolutePath(configName)) {
        m_configPath = configName;
    } else {
        m_configPath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
                     + QLatin1Char('/') + configName;
    }

    qCDebug(ConfigLog) << "Watching config file:" << m_configPath;

    if (QFile::exists(m_configPath)) {
        m_fileWatcher->addPath(m_configPath);
    }

    connect(m_fileWatcher, &QFileSystemWatcher::fileChanged,
            this, &PassKeyConfiguration::onConfigFileChanged);
}

void PassKeyConfiguration::reload()
{
    m_config->reparseConfiguration();
    m_configGroup = m_config->group(QString::fromLatin1(ConfigKeys::GENERAL_GROUP));
    Q_EMIT configurationChanged();
}

QString PassKeyConfiguration::secret() const
{
    const QString fromEnv = qEnvironmentVariable(ConfigKeys::SECRET_ENV);
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    return readConfigEntry(ConfigKeys::SECRET, QString()).trimmed();
}

Result<std::chrono::seconds> PassKeyConfiguration::interval() const
{
    const QString fromEnv = qEnvironmentVariable(ConfigKeys::INTERVAL_ENV);
    if (!fromEnv.isEmpty()) {
        return parseSeconds(fromEnv, QString::fromLatin1(ConfigKeys::INTERVAL_ENV));
    }

    const QString fromFile = readConfigEntry(ConfigKeys::INTERVAL, QString());
    if (fromFile.isEmpty()) {
        return Result<std::chrono::seconds>::success(std::chrono::seconds(0));
    }
    return parseSeconds(fromFile, QString::fromLatin1(ConfigKeys::INTERVAL));
}

QByteArray PassKeyConfiguration::headerKey() const
{
    const QString key = readConfigEntry(ConfigKeys::HEADER_KEY, QString()).trimmed();
    return key.isEmpty() ? QByteArrayLiteral("token") : key.toLatin1();
}

void PassKeyConfiguration::onConfigFileChanged(const QString &path)
{
    qCDebug(ConfigLog) << "Config file changed:" << path;

    reload();

    // QFileSystemWatcher drops the path after some editors replace the file
    if (!m_fileWatcher->files().contains(path) && QFile::exists(path)) {
        m_fileWatcher->addPath(path);
    }
}

} // namespace Config
} // namespace PassKey
