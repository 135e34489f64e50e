/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "errors.h"

QString errorTypeName(ErrorType type) {
    switch (type) {
        case ErrorType::E_NoError:
            return QStringLiteral("no-error");
        case ErrorType::E_Network:
            return QStringLiteral("network-error");
        case ErrorType::E_Protocol:
            return QStringLiteral("protocol-error");
        case ErrorType::E_ResourceExhaustion:
            return QStringLiteral("resource-exhaustion");
        case ErrorType::E_DeviceNotFound:
            return QStringLiteral("device-not-found");
        case ErrorType::E_Config:
            return QStringLiteral("config-error");
        case ErrorType::E_MediaNotFound:
            return QStringLiteral("media-not-found");
    }
    return QStringLiteral("unknown");
}

QDebug operator<<(QDebug debug, ErrorType type) {
    QDebugStateSaver saver{debug};
    debug.nospace() << errorTypeName(type);
    return debug;
}

LoopcastError::LoopcastError(ErrorType type, const QString &message)
    : std::runtime_error{message.toStdString()}, m_type{type} {}

Result Result::fromError(const LoopcastError &err) {
    return {err.type(), err.message()};
}

Result Result::fromError(ErrorType error, const QString &message) {
    return {error, message};
}

QDebug operator<<(QDebug debug, const Result &result) {
    QDebugStateSaver saver{debug};
    if (result) {
        debug.nospace() << "ok";
    } else {
        debug.nospace() << result.error << ": " << result.message;
    }
    return debug;
}
