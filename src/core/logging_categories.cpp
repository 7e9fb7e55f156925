/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "logging_categories.h"

namespace PassKey {

// Session engine
Q_LOGGING_CATEGORY(EngineLog, "passkey.engine", QtWarningMsg)

// Core components
Q_LOGGING_CATEGORY(RotationLog, "passkey.rotation", QtWarningMsg)
Q_LOGGING_CATEGORY(ValidatorLog, "passkey.validator", QtWarningMsg)

// Collaborators
Q_LOGGING_CATEGORY(ConfigLog, "passkey.config", QtWarningMsg)
Q_LOGGING_CATEGORY(EndpointLog, "passkey.endpoints", QtWarningMsg)

} // namespace PassKey
