/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QByteArray>
#include "common/result.h"

namespace PassKey {
namespace Core {
using Shared::Result;

/**
 * @brief RFC 4648 base32 codec (standard alphabet, '=' padding)
 *
 * Alphabet: A-Z (0-25), 2-7 (26-31). Used for both the shared secret and the
 * transport token, so both sides agree on one text form.
 *
 * Decoding is strict: upper-case alphabet only, input length a multiple of 8,
 * padding only at the end and only in the counts RFC 4648 allows.
 */
class Base32
{
public:
    /**
     * @brief Encodes bytes into padded base32 text
     * @param data Raw bytes
     * @return ASCII text, length is a multiple of 8
     */
    [[nodiscard]] static QByteArray encode(const QByteArray &data);

    /**
     * @brief Decodes padded base32 text
     * @param text ASCII text
     * @return Decoded bytes, or an error describing the first problem found
     *
     * The error code is left to the caller's domain; this returns
     * ErrorCode::MalformedCredential and callers re-map where needed.
     */
    [[nodiscard]] static Result<QByteArray> decode(const QByteArray &text);

    /**
     * @brief Length of the encoding of @p byteCount bytes, padding included
     */
    static constexpr int encodedLength(int byteCount)
    {
        return ((byteCount + 4) / 5) * 8;
    }

private:
    Base32() = delete;
};

} // namespace Core
} // namespace PassKey
