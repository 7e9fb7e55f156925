/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "base32.h"

#include <KLocalizedString>

namespace PassKey {
namespace Core {
using Shared::ErrorCode;

namespace {

constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr char PAD = '=';

int symbolValue(char ch)
{
    if (ch >= 'A' && ch <= 'Z') {
        return ch - 'A';
    }
    if (ch >= '2' && ch <= '7') {
        return ch - '2' + 26;
    }
    return -1;
}

} // namespace

QByteArray Base32::encode(const QByteArray &data)
{
    QByteArray result;
    result.reserve(encodedLength(static_cast<int>(data.size())));

    quint64 buffer = 0;
    int bitsInBuffer = 0;

    for (const char byte : data) {
        buffer = (buffer << 8) | static_cast<quint8>(byte);
        bitsInBuffer += 8;

        while (bitsInBuffer >= 5) {
            bitsInBuffer -= 5;
            result.append(ALPHABET[(buffer >> bitsInBuffer) & 0x1F]);
        }
    }

    // Flush the remaining bits, zero-filled on the right
    if (bitsInBuffer > 0) {
        result.append(ALPHABET[(buffer << (5 - bitsInBuffer)) & 0x1F]);
    }

    while (result.size() % 8 != 0) {
        result.append(PAD);
    }

    return result;
}

Result<QByteArray> Base32::decode(const QByteArray &text)
{
    if (text.size() % 8 != 0) {
        return Result<QByteArray>::error(ErrorCode::MalformedCredential,
                                         i18n("Base32 text length must be a multiple of 8"));
    }

    qsizetype padding = 0;
    while (padding < text.size() && text.at(text.size() - 1 - padding) == PAD) {
        ++padding;
    }

    // Only 0, 1, 3, 4 or 6 pad characters can end a group
    if (padding == 2 || padding == 5 || padding > 6) {
        return Result<QByteArray>::error(ErrorCode::MalformedCredential,
                                         i18n("Invalid Base32 padding"));
    }

    const qsizetype symbols = text.size() - padding;

    QByteArray result;
    result.reserve(symbols * 5 / 8);

    quint64 buffer = 0;
    int bitsInBuffer = 0;

    for (qsizetype i = 0; i < symbols; ++i) {
        const int value = symbolValue(text.at(i));
        if (value < 0) {
            return Result<QByteArray>::error(ErrorCode::MalformedCredential,
                                             i18n("Invalid Base32 character at position %1", i));
        }

        buffer = (buffer << 5) | static_cast<quint64>(value);
        bitsInBuffer += 5;

        if (bitsInBuffer >= 8) {
            bitsInBuffer -= 8;
            result.append(static_cast<char>((buffer >> bitsInBuffer) & 0xFF));
        }
    }

    return Result<QByteArray>::success(result);
}

} // namespace Core
} // namespace PassKey
