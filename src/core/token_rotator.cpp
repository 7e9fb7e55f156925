/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "token_rotator.h"

#include <QMessageAuthenticationCode>
#include <QtEndian>

namespace PassKey {
namespace Core {
namespace TokenRotator {

qint64 timeBucket(std::chrono::seconds interval, Slot slot, const QDateTime &now)
{
    Q_ASSERT(interval.count() > 0);

    const qint64 period = interval.count();
    const qint64 seconds = now.toSecsSinceEpoch();

    // Floor division, also for instants before the epoch
    qint64 aligned = (seconds / period) * period;
    if (seconds < 0 && seconds % period != 0) {
        aligned -= period;
    }

    const qint64 shift = static_cast<qint64>(slot) - 1;
    return aligned + shift * period;
}

quint64 truncate(const QByteArray &digest)
{
    if (digest.size() != DIGEST_SIZE) {
        return 0;
    }

    const auto *bytes = reinterpret_cast<const uchar *>(digest.constData());
    const int offset = ((bytes[DIGEST_SIZE - 1] & 0x0F) / 2) + 1;
    return qFromLittleEndian<quint64>(bytes + offset);
}

quint64 derive(const QByteArray &key, std::chrono::seconds interval, Slot slot, const QDateTime &now)
{
    const qint64 bucket = timeBucket(interval, slot, now);

    uchar message[CODE_SIZE];
    qToLittleEndian<quint64>(static_cast<quint64>(bucket), message);

    const QByteArray digest = QMessageAuthenticationCode::hash(
        QByteArray::fromRawData(reinterpret_cast<const char *>(message), CODE_SIZE),
        key,
        QCryptographicHash::Sha1);

    return truncate(digest);
}

} // namespace TokenRotator
} // namespace Core
} // namespace PassKey
