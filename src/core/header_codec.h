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
 * @brief Transport form of a derived code
 *
 * Layout before text encoding (TOKEN_SIZE bytes):
 *   [0..8)  code, little-endian
 *   [8..10) random padding, regenerated on every encode()
 *
 * The padding only varies the text; it carries no meaning and decode()
 * ignores it. The text is base32, the same encoding as the secret:
 * 10 bytes become 16 characters with no '=' padding.
 */
namespace HeaderCodec {

constexpr int CODE_SIZE = 8;
constexpr int PADDING_SIZE = 2;
constexpr int TOKEN_SIZE = CODE_SIZE + PADDING_SIZE;

/**
 * @brief Builds the transport token for @p code
 */
QByteArray encode(quint64 code);

/**
 * @brief Recovers the code from a transport token
 * @return ErrorCode::MalformedCredential if the text is not base32 or does
 *         not decode to exactly TOKEN_SIZE bytes
 */
Result<quint64> decode(const QByteArray &token);

} // namespace HeaderCodec
} // namespace Core
} // namespace PassKey
