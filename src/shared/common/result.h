/*
 * SPDX-FileCopyrightText: 2025 PassKey Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <utility>

namespace PassKey {
namespace Shared {

/**
 * @brief Error categories reported through Result
 *
 * Callers branch on the code; the message is for humans.
 */
enum class ErrorCode {
    None = 0,
    InvalidSecret,          ///< Secret failed to decode or has the wrong length
    InvalidInterval,        ///< Interval is not a usable number of seconds
    MalformedCredential,    ///< Transport token failed to decode or has the wrong length
    UnauthorizedCredential, ///< Token is well-formed but not in the live window
    RandomnessUnavailable,  ///< CSPRNG could not provide key or padding material
    AlreadyRunning,         ///< Operation not allowed while rotation is active
    Cancelled               ///< Session context was cancelled before start
};

/**
 * @brief Result type for unified error handling
 *
 * Holds either a value or an ErrorCode with a message.
 *
 * Usage:
 * @code
 * Result<quint64> decoded = HeaderCodec::decode(token);
 * if (!decoded) {
 *     qCWarning(ValidatorLog) << "Rejected:" << decoded.error();
 *     return decoded.code();
 * }
 * use(decoded.value());
 * @endcode
 */
template<typename T>
class Result {
public:
    static Result success(T value) {
        return Result(std::move(value), ErrorCode::None, QString());
    }

    /**
     * @brief Creates an error result
     * @param code Error category, must not be ErrorCode::None
     * @param errorMessage Description of the error
     */
    static Result error(ErrorCode code, const QString &errorMessage) {
        Q_ASSERT(code != ErrorCode::None);
        return Result(T(), code, errorMessage);
    }

    bool isSuccess() const {
        return m_code == ErrorCode::None;
    }

    bool isError() const {
        return m_code != ErrorCode::None;
    }

    /**
     * @brief Gets the success value
     * @warning Only call if isSuccess() returns true
     */
    T value() const {
        Q_ASSERT(isSuccess());
        return m_value;
    }

    T valueOr(const T &defaultValue) const {
        return isSuccess() ? m_value : defaultValue;
    }

    ErrorCode code() const {
        return m_code;
    }

    QString error() const {
        return m_error;
    }

    /**
     * @brief Re-types an error result so it can be propagated
     * @warning Only call if isError() returns true
     */
    template<typename U>
    Result<U> propagate() const {
        Q_ASSERT(isError());
        return Result<U>::error(m_code, m_error);
    }

    explicit operator bool() const {
        return isSuccess();
    }

private:
    Result(T value, ErrorCode code, QString error)
        : m_value(std::move(value))
        , m_code(code)
        , m_error(std::move(error))
    {
    }

    T m_value;
    ErrorCode m_code;
    QString m_error;
};

/**
 * @brief Specialization of Result for operations without a value
 */
template<>
class Result<void> {
public:
    static Result success() {
        return Result(ErrorCode::None, QString());
    }

    static Result error(ErrorCode code, const QString &errorMessage) {
        Q_ASSERT(code != ErrorCode::None);
        return Result(code, errorMessage);
    }

    bool isSuccess() const {
        return m_code == ErrorCode::None;
    }

    bool isError() const {
        return m_code != ErrorCode::None;
    }

    ErrorCode code() const {
        return m_code;
    }

    QString error() const {
        return m_error;
    }

    template<typename U>
    Result<U> propagate() const {
        Q_ASSERT(isError());
        return Result<U>::error(m_code, m_error);
    }

    explicit operator bool() const {
        return isSuccess();
    }

private:
    Result(ErrorCode code, QString error)
        : m_code(code)
        , m_error(std::move(error))
    {
    }

    ErrorCode m_code;
    QString m_error;
};

} // namespace Shared
} // namespace PassKey
