/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

namespace PassKey {
namespace Shared {
namespace ConfigKeys {

/**
 * @brief Keys of the passkeyrc [General] group
 *
 * IMPORTANT: Do not change these values as they are persisted in user configuration files.
 */

constexpr const char *GENERAL_GROUP = "General";

constexpr const char *SECRET = "Secret";
constexpr const char *INTERVAL = "Interval";
constexpr const char *HEADER_KEY = "HeaderKey";

/// Environment variables that override the file
constexpr const char *SECRET_ENV = "PASSKEY_SECRET";
constexpr const char *INTERVAL_ENV = "PASSKEY_INTERVAL";

} // namespace ConfigKeys
} // namespace Shared
} // namespace PassKey
