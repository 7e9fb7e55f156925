/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "config/configuration_provider.h"
#include "config/configuration_keys.h"

#include <KConfigGroup>
#include <KSharedConfig>
#include <QFileSystemWatcher>
#include <QObject>
#include <QString>

namespace PassKey {
namespace Config {
using Shared::Result;

/**
 * @brief KConfig-backed settings
 *
 * Reads the [General] group of passkeyrc. PASSKEY_SECRET and
 * PASSKEY_INTERVAL in the environment take precedence over the file.
 * The file is watched and configurationChanged() is emitted after reload.
 */
class PassKeyConfiguration : public QObject, public Shared::ConfigurationProvider
{
    Q_OBJECT

public:
    static constexpr const char *DEFAULT_CONFIG_NAME = "passkeyrc";

    /**
     * @param configName File name under the user config directory, or an absolute path
     */
    explicit PassKeyConfiguration(const QString &configName = QString::fromLatin1(DEFAULT_CONFIG_NAME),
                                  QObject *parent = nullptr);

    void reload() override;

    QString secret() const override;
    Result<std::chrono::seconds> interval() const override;
    QByteArray headerKey() const override;

    /**
     * @brief Path of the file being read
     */
    QString configPath() const { return m_configPath; }

Q_SIGNALS:
    void configurationChanged();

private Q_SLOTS:
    void onConfigFileChanged(const QString &path);

private:
    KSharedConfig::Ptr m_config;
    KConfigGroup m_configGroup;
    QFileSystemWatcher *m_fileWatcher;
    QString m_configPath;

    template<typename T>
    T readConfigEntry(const char *key, const T &defaultValue) const {
        return m_configGroup.readEntry(key, defaultValue);
    }
};

} // namespace Config
} // namespace PassKey
