/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "token_rotator.h"

#include <QtGlobal>
#include <array>
#include <atomic>

namespace PassKey {
namespace Core {

/**
 * @brief The three live codes {previous, current, next}
 *
 * Each slot is its own atomic cell: a reader never sees a torn value, but
 * the window as a whole is not updated atomically. During rotate() a reader
 * may see previous already advanced while current/next are not (or the
 * reverse). Every value it can observe is still a code for a bucket inside
 * the tolerated span, so no lock serializes the window.
 *
 * Zero is the "not populated" sentinel. contains() never matches it.
 *
 * Thread safety: one writer (the rotation scheduler), any number of readers.
 */
class TokenWindow
{
public:
    TokenWindow() = default;

    TokenWindow(const TokenWindow &) = delete;
    TokenWindow &operator=(const TokenWindow &) = delete;

    quint64 load(Slot slot) const
    {
        return m_slots[index(slot)].load(std::memory_order_acquire);
    }

    void store(Slot slot, quint64 code)
    {
        m_slots[index(slot)].store(code, std::memory_order_release);
    }

    quint64 previous() const { return load(Slot::Previous); }
    quint64 current() const { return load(Slot::Current); }
    quint64 next() const { return load(Slot::Next); }

    /**
     * @brief Shifts the window by one interval
     * @param freshNext Code derived for the new "next" bucket
     *
     * current -> previous, next -> current, then freshNext -> next.
     * Three independent stores.
     */
    void rotate(quint64 freshNext);

    /**
     * @brief True if @p code equals one of the three slots
     *
     * The slots are loaded independently, in no particular order.
     */
    bool contains(quint64 code) const;

    /**
     * @brief Returns every slot to the zero sentinel
     */
    void reset();

private:
    static constexpr std::size_t index(Slot slot)
    {
        return static_cast<std::size_t>(slot);
    }

    std::array<std::atomic<quint64>, 3> m_slots{};
};

} // namespace Core
} // namespace PassKey
