/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <QSettings>
#include <QString>

#include "avtransportclient.h"
#include "devicemanager.h"
#include "discoveryclient.h"
#include "logger.hpp"
#include "streamserver.h"

class Settings : public QSettings {
   public:
    // Default file is used when path is empty.
    explicit Settings(const QString &path = {});

    LoopcastLogger::LogType logLevel() const;
    QString logFile() const;

    int portMin() const;
    int portMax() const;
    QString streamAddress() const;
    QString scratchDir() const;

    int discoveryInterval() const;
    int discoveryTimeout() const;
    QString searchTarget() const;
    int mx() const;
    int ttl() const;

    int controlTimeout() const;
    int controlRetries() const;
    int controlRetryDelay() const;

    int pollInterval() const;
    int failureThreshold() const;
    int backoffCeiling() const;

    QString autoPlayConfig() const;
    int autoPlayRetryDelay() const;

    QString cacheDir() const;

    StreamServer::Config streamServerConfig() const;
    DiscoveryClient::Config discoveryConfig() const;
    AvTransportClient::Options controlOptions() const;
    DeviceManager::Config managerConfig() const;

   private:
    inline static const QString settingsFilename =
        QStringLiteral("settings.ini");

    static QString settingsFilepath();
};

#endif  // SETTINGS_H
