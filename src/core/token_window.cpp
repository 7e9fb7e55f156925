/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "token_window.h"

namespace PassKey {
namespace Core {

void TokenWindow::rotate(quint64 freshNext)
{
    store(Slot::Previous, current());
    store(Slot::Current, next());
    store(Slot::Next, freshNext);
}

bool TokenWindow::contains(quint64 code) const
{
    if (code == 0) {
        return false;
    }

    return code == previous() || code == current() || code == next();
}

void TokenWindow::reset()
{
    for (auto &slot : m_slots) {
        slot.store(0, std::memory_order_release);
    }
}

} // namespace Core
} // namespace PassKey
