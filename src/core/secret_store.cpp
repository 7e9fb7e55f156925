/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "secret_store.h"
#include "utils/base32.h"
#include "utils/secure_memory.h"

#include <QRandomGenerator>
#include <KLocalizedString>

#include <array>
#include <cstring>

namespace PassKey {
namespace Core {
using Shared::ErrorCode;

SecretStore::SecretStore()
    : m_key(SECRET_SIZE, '\0')
{
}

SecretStore::~SecretStore()
{
    SecureMemory::wipeByteArray(m_key);
}

SecretStore::SecretStore(const SecretStore &other)
    : m_key(other.m_key.constData(), other.m_key.size())
{
}

SecretStore &SecretStore::operator=(const SecretStore &other)
{
    if (this != &other) {
        SecureMemory::zero(m_key.data(), static_cast<size_t>(m_key.size()));
        m_key = QByteArray(other.m_key.constData(), other.m_key.size());
    }
    return *this;
}

Result<void> SecretStore::setRawSecret(const QByteArray &key)
{
    // Deep copy first: key may alias m_key
    QByteArray incoming(key.constData(), key.size());
    clear();

    if (incoming.size() != SECRET_SIZE) {
        SecureMemory::wipeByteArray(incoming);
        return Result<void>::error(ErrorCode::InvalidSecret,
                                   i18n("Secret must be exactly %1 bytes, got %2",
                                        SECRET_SIZE, key.size()));
    }

    m_key = std::move(incoming);
    return Result<void>::success();
}

Result<void> SecretStore::setEncodedSecret(const QString &encoded)
{
    clear();

    if (encoded.length() != ENCODED_SECRET_LENGTH) {
        return Result<void>::error(ErrorCode::InvalidSecret,
                                   i18n("Secret must be %1 Base32 characters, got %2",
                                        ENCODED_SECRET_LENGTH, encoded.length()));
    }

    QByteArray text = encoded.toLatin1();
    Result<QByteArray> decoded = Base32::decode(text);
    SecureMemory::wipeByteArray(text);

    if (!decoded) {
        return Result<void>::error(ErrorCode::InvalidSecret,
                                   i18n("Secret is not valid Base32: %1", decoded.error()));
    }

    QByteArray key = decoded.value();
    const Result<void> stored = setRawSecret(key);
    SecureMemory::wipeByteArray(key);
    return stored;
}

Result<void> SecretStore::generate()
{
    clear();

    // system() reads the operating system CSPRNG directly
    std::array<quint32, SECRET_SIZE / sizeof(quint32)> words{};
    QRandomGenerator::system()->fillRange(words.data(), static_cast<qsizetype>(words.size()));
    std::memcpy(m_key.data(), words.data(), SECRET_SIZE);
    SecureMemory::zero(words.data(), sizeof(words));

    if (isSentinel()) {
        return Result<void>::error(ErrorCode::RandomnessUnavailable,
                                   i18n("System random number generator returned no key material"));
    }

    return Result<void>::success();
}

void SecretStore::clear()
{
    if (m_key.size() != SECRET_SIZE) {
        m_key = QByteArray(SECRET_SIZE, '\0');
        return;
    }
    SecureMemory::zero(m_key.data(), SECRET_SIZE);
}

bool SecretStore::isSentinel() const
{
    for (const char byte : m_key) {
        if (byte != '\0') {
            return false;
        }
    }
    return true;
}

QString SecretStore::encoded() const
{
    return QString::fromLatin1(Base32::encode(m_key));
}

} // namespace Core
} // namespace PassKey
