/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ERRORS_H
#define ERRORS_H

#include <QDebug>
#include <QString>
#include <stdexcept>
#include <string>

enum class ErrorType {
    E_NoError,
    E_Network,
    E_Protocol,
    E_ResourceExhaustion,
    E_DeviceNotFound,
    E_Config,
    E_MediaNotFound
};

QString errorTypeName(ErrorType type);
QDebug operator<<(QDebug debug, ErrorType type);

class LoopcastError : public std::runtime_error {
   public:
    LoopcastError(ErrorType type, const QString &message);
    inline ErrorType type() const { return m_type; }
    inline QString message() const { return QString::fromStdString(what()); }

   private:
    ErrorType m_type;
};

// Timeout, connection refused or reset. Transient, so callers may retry.
class NetworkError : public LoopcastError {
   public:
    explicit NetworkError(const QString &message)
        : LoopcastError{ErrorType::E_Network, message} {}
};

// Malformed XML, SOAP fault or unexpected response. Never retried.
class ProtocolError : public LoopcastError {
   public:
    explicit ProtocolError(const QString &message, int upnpErrorCode = 0)
        : LoopcastError{ErrorType::E_Protocol, message},
          m_upnpErrorCode{upnpErrorCode} {}
    inline int upnpErrorCode() const { return m_upnpErrorCode; }

   private:
    int m_upnpErrorCode = 0;
};

class ResourceExhaustion : public LoopcastError {
   public:
    explicit ResourceExhaustion(const QString &message)
        : LoopcastError{ErrorType::E_ResourceExhaustion, message} {}
};

class DeviceNotFound : public LoopcastError {
   public:
    explicit DeviceNotFound(const QString &deviceId)
        : LoopcastError{ErrorType::E_DeviceNotFound,
                        QStringLiteral("unknown device: %1").arg(deviceId)} {}
};

class ConfigError : public LoopcastError {
   public:
    explicit ConfigError(const QString &message)
        : LoopcastError{ErrorType::E_Config, message} {}
};

class MediaNotFound : public LoopcastError {
   public:
    explicit MediaNotFound(const QString &path)
        : LoopcastError{ErrorType::E_MediaNotFound,
                        QStringLiteral("media file not found: %1").arg(path)} {
    }
};

/*
 * Outcome of a device manager command. Converts to true on success.
 */
struct Result {
    ErrorType error = ErrorType::E_NoError;
    QString message;

    explicit operator bool() const { return error == ErrorType::E_NoError; }
    static Result fromError(const LoopcastError &err);
    static Result fromError(ErrorType error, const QString &message);
    friend QDebug operator<<(QDebug debug, const Result &result);
};

#endif  // ERRORS_H
