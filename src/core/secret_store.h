/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QString>
#include "common/result.h"

namespace PassKey {
namespace Core {
using Shared::Result;

/**
 * @brief Holds the raw shared secret
 *
 * The secret is always SECRET_SIZE bytes. An all-zero key is the
 * "uninitialized" sentinel and must never be used to derive a code.
 *
 * Two explicitly named setters replace a dynamically typed one:
 * - setRawSecret() takes key bytes
 * - setEncodedSecret() takes the 32-character base32 text form
 *
 * A rejected value leaves the store at the sentinel, never at a partially
 * copied or previous key, and is reported as ErrorCode::InvalidSecret.
 *
 * Key bytes are wiped from memory when replaced or destroyed.
 */
class SecretStore
{
public:
    static constexpr int SECRET_SIZE = 20;          ///< HMAC-SHA1 key length
    static constexpr int ENCODED_SECRET_LENGTH = 32; ///< base32 length of SECRET_SIZE bytes

    SecretStore();
    ~SecretStore();

    SecretStore(const SecretStore &other);
    SecretStore &operator=(const SecretStore &other);

    /**
     * @brief Stores a raw key
     * @param key Exactly SECRET_SIZE bytes
     */
    Result<void> setRawSecret(const QByteArray &key);

    /**
     * @brief Stores a key given as base32 text
     * @param encoded ENCODED_SECRET_LENGTH characters from [A-Z2-7]
     */
    Result<void> setEncodedSecret(const QString &encoded);

    /**
     * @brief Replaces the key with SECRET_SIZE bytes from the system CSPRNG
     * @return ErrorCode::RandomnessUnavailable if the source yielded the sentinel
     */
    Result<void> generate();

    /**
     * @brief Resets the store to the zero sentinel
     */
    void clear();

    /**
     * @brief True while the key is all zeros
     */
    bool isSentinel() const;

    /**
     * @brief Raw key bytes (always SECRET_SIZE long)
     */
    const QByteArray &key() const { return m_key; }

    /**
     * @brief base32 text form of the key, for display to the operator
     */
    QString encoded() const;

private:
    QByteArray m_key;
};

} // namespace Core
} // namespace PassKey
