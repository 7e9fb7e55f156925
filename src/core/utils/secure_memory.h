/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>

namespace PassKey {
namespace Core {

/**
 * @brief Secure wiping of shared-secret material
 *
 * Keeps raw keys and their text encodings from lingering in freed memory
 * (core dumps, swap).
 */
class SecureMemory
{
public:
    /**
     * @brief Overwrites the bytes of @p data with zeros, then clears it
     *
     * Uses explicit_bzero if available, fallback to volatile stores.
     * A shared (implicitly copied) array is detached first, so only this
     * instance's buffer is wiped.
     */
    static void wipeByteArray(QByteArray &data);

    /**
     * @brief Zeros @p size bytes at @p ptr in place without clearing anything
     *
     * Used on fixed-size buffers whose length must be kept.
     */
    static void zero(void *ptr, size_t size);

private:
    SecureMemory() = delete;
};

} // namespace Core
} // namespace PassKey
