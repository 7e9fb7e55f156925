/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"

#include <QByteArray>
#include <QString>
#include <chrono>

namespace PassKey {
namespace Shared {

/**
 * @brief Pure interface for reading session settings
 *
 * @note Concrete implementations inherit from QObject as well when they
 *       need to signal configuration changes
 */
class ConfigurationProvider
{
public:
    virtual ~ConfigurationProvider() = default;

    /**
     * @brief Reloads configuration from storage
     */
    virtual void reload() = 0;

    /**
     * @brief Gets the base32 shared secret
     * @return Encoded secret, empty if none is configured
     */
    virtual QString secret() const = 0;

    /**
     * @brief Gets the rotation interval
     * @return Seconds, zero when unset, ErrorCode::InvalidInterval if the
     *         configured value is not a non-negative integer
     */
    virtual Result<std::chrono::seconds> interval() const = 0;

    /**
     * @brief Gets the request header carrying the token
     */
    virtual QByteArray headerKey() const = 0;
};

} // namespace Shared
} // namespace PassKey
