/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "session_context.h"

namespace PassKey {
namespace Core {

SessionContext::SessionContext(QObject *parent)
    : QObject(parent)
{
}

void SessionContext::cancel()
{
    if (m_cancelled.exchange(true)) {
        return;
    }
    Q_EMIT cancelled();
}

bool SessionContext::isCancelled() const
{
    return m_cancelled.load();
}

} // namespace Core
} // namespace PassKey
