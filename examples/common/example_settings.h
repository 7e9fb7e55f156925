/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "config/passkey_configuration.h"
#include "core/logging_categories.h"

#include <QString>
#include <chrono>

namespace PassKey {
namespace Examples {

/// Shared by the example server and client so they agree without configuration
constexpr const char *EXAMPLE_SECRET = "PASSKEYXXBASE32XXSECRETXXEXAMPLE";
constexpr std::chrono::seconds EXAMPLE_INTERVAL{15};
constexpr quint16 EXAMPLE_PORT = 8080;

struct ExampleSettings {
    QString secret;
    std::chrono::seconds interval{0};
    QByteArray headerKey;
};

/**
 * @brief passkeyrc values, falling back to the example constants
 * @return ErrorCode::InvalidInterval if passkeyrc holds a bad interval
 */
inline Shared::Result<ExampleSettings> loadExampleSettings(const Config::PassKeyConfiguration &config)
{
    const Shared::Result<std::chrono::seconds> interval = config.interval();
    if (!interval) {
        return interval.propagate<ExampleSettings>();
    }

    ExampleSettings settings;
    settings.secret = config.secret().isEmpty() ? QString::fromLatin1(EXAMPLE_SECRET) : config.secret();
    settings.interval = interval.value().count() > 0 ? interval.value() : EXAMPLE_INTERVAL;
    settings.headerKey = config.headerKey();

    qCDebug(ConfigLog) << "Example settings from" << config.configPath()
                       << "interval" << settings.interval.count() << "s";
    return Shared::Result<ExampleSettings>::success(settings);
}

} // namespace Examples
} // namespace PassKey
