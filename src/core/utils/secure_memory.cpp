/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "secure_memory.h"

#include <cstring>

#if defined(__GLIBC__) && \
    (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 25))
constexpr bool HAVE_EXPLICIT_BZERO = true;
#elif defined(__OpenBSD__) || defined(__FreeBSD__) || defined(__NetBSD__)
constexpr bool HAVE_EXPLICIT_BZERO = true;
#else
constexpr bool HAVE_EXPLICIT_BZERO = false;
#endif

namespace PassKey {
namespace Core {

void SecureMemory::zero(void *ptr, size_t size)
{
    if (!ptr || size == 0) {
        return;
    }

    if constexpr (HAVE_EXPLICIT_BZERO) {
        explicit_bzero(ptr, size);
    } else {
        // NOLINTNEXTLINE(misc-const-correctness)
        volatile unsigned char *p = static_cast<volatile unsigned char *>(ptr);
        for (size_t i = 0; i < size; ++i) {
            p[i] = 0;
        }
    }
}

void SecureMemory::wipeByteArray(QByteArray &data)
{
    if (data.isEmpty()) {
        return;
    }

    // data() detaches a shared buffer before we touch it
    // NOLINTNEXTLINE(misc-const-correctness)
    char *ptr = data.data();
    zero(ptr, static_cast<size_t>(data.size()));
    data.clear();
}

} // namespace Core
} // namespace PassKey
