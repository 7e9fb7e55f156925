/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "common/result.h"

#include <QString>
#include <QStringList>
#include <chrono>

namespace PassKey {
namespace Pkgen {
using Shared::Result;

/// File in the home directory holding a default secret
constexpr const char *HOME_SECRET_FILE = ".pkgen";

struct Options {
    QString secret;                  ///< Empty: generate and print a new secret
    std::chrono::seconds interval{0}; ///< Zero: default interval
};

/**
 * @brief Reads the first 32 bytes of ~/.pkgen
 * @return The secret text, empty if the file is missing or unreadable
 */
QString readHomeSecret();

/**
 * @brief Resolves secret and interval the way pkgen documents them
 *
 * Secret: envSecret, else positional[0]; with neither and no positional
 * arguments at all, homeSecret.
 * Interval: envInterval, else positional[1].
 *
 * @return ErrorCode::InvalidInterval if the chosen interval is not a
 *         non-negative integer
 */
Result<Options> resolveOptions(const QStringList &positional,
                               const QString &envSecret,
                               const QString &envInterval,
                               const QString &homeSecret);

} // namespace Pkgen
} // namespace PassKey
