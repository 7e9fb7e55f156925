/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QLoggingCategory>

namespace PassKey {

/**
 * @brief Qt Logging Categories for PassKey
 *
 * Control via environment:
 *   QT_LOGGING_RULES="passkey.*=true"
 */

// Session engine
Q_DECLARE_LOGGING_CATEGORY(EngineLog)

// Core components
Q_DECLARE_LOGGING_CATEGORY(RotationLog)
Q_DECLARE_LOGGING_CATEGORY(ValidatorLog)

// Collaborators
Q_DECLARE_LOGGING_CATEGORY(ConfigLog)
Q_DECLARE_LOGGING_CATEGORY(EndpointLog)

} // namespace PassKey
