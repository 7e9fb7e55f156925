/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QDateTime>
#include <chrono>

namespace PassKey {
namespace Core {

/**
 * @brief Position of a code inside the rolling window
 *
 * The value minus one is the bucket shift in intervals.
 */
enum class Slot {
    Previous = 0, ///< one interval behind now
    Current = 1,  ///< the interval containing now
    Next = 2      ///< one interval ahead of now
};

/**
 * @brief Derives time-keyed codes from the shared secret
 *
 * Pure functions; a code depends only on key, interval, slot and the
 * bucket that @p now falls into.
 *
 * Derivation:
 *   bucket = floor(now / interval) * interval + (slot - 1) * interval
 *   digest = HMAC-SHA1(key, bucket as 8 bytes little-endian)
 *   offset = ((digest[19] & 0xF) / 2) + 1            (range 1..8)
 *   code   = digest[offset .. offset+8) as little-endian quint64
 *
 * @note The offset formula is not the RFC 4226 dynamic truncation. It keeps
 *       an 8-byte read inside the 20-byte digest, and it must stay bit-exact
 *       to interoperate with peers already deployed with the same secret.
 */
namespace TokenRotator {

/// HMAC-SHA1 output length
constexpr int DIGEST_SIZE = 20;

/// Width of a derived code in bytes
constexpr int CODE_SIZE = 8;

/**
 * @brief Unix time (seconds) of the bucket a slot refers to
 * @param interval Rotation period, must be positive
 * @param slot Window position
 * @param now Reference instant
 */
qint64 timeBucket(std::chrono::seconds interval, Slot slot, const QDateTime &now);

/**
 * @brief Extracts the code from an HMAC-SHA1 digest
 * @param digest DIGEST_SIZE bytes
 * @return Derived code, or 0 if @p digest has the wrong size
 */
quint64 truncate(const QByteArray &digest);

/**
 * @brief Derives the code for one window slot
 * @param key Shared secret bytes
 * @param interval Rotation period, must be positive
 * @param slot Window position relative to @p now
 * @param now Reference instant
 */
quint64 derive(const QByteArray &key, std::chrono::seconds interval, Slot slot, const QDateTime &now);

} // namespace TokenRotator
} // namespace Core
} // namespace PassKey
