/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "header_codec.h"
#include "utils/base32.h"

#include <QRandomGenerator>
#include <QtEndian>
#include <KLocalizedString>

namespace PassKey {
namespace Core {
namespace HeaderCodec {
using Shared::ErrorCode;

QByteArray encode(quint64 code)
{
    uchar buffer[TOKEN_SIZE];
    qToLittleEndian<quint64>(code, buffer);

    const quint32 noise = QRandomGenerator::system()->generate();
    buffer[CODE_SIZE] = static_cast<uchar>(noise & 0xFF);
    buffer[CODE_SIZE + 1] = static_cast<uchar>((noise >> 8) & 0xFF);

    return Base32::encode(QByteArray(reinterpret_cast<const char *>(buffer), TOKEN_SIZE));
}

Result<quint64> decode(const QByteArray &token)
{
    if (token.isEmpty()) {
        return Result<quint64>::error(ErrorCode::MalformedCredential, i18n("Token is missing"));
    }

    const Result<QByteArray> decoded = Base32::decode(token);
    if (!decoded) {
        return decoded.propagate<quint64>();
    }

    const QByteArray bytes = decoded.value();
    if (bytes.size() != TOKEN_SIZE) {
        return Result<quint64>::error(ErrorCode::MalformedCredential,
                                      i18n("Token must decode to %1 bytes, got %2",
                                           TOKEN_SIZE, bytes.size()));
    }

    return Result<quint64>::success(qFromLittleEndian<quint64>(bytes.constData()));
}

} // namespace HeaderCodec
} // namespace Core
} // namespace PassKey
