/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "settings.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <algorithm>

#include "config.h"

QString Settings::settingsFilepath() {
    QDir confDir{
        QStandardPaths::writableLocation(QStandardPaths::ConfigLocation)};
    confDir.mkpath(QCoreApplication::organizationName() + QDir::separator() +
                   QCoreApplication::applicationName());
    return confDir.absolutePath() + QDir::separator() +
           QCoreApplication::organizationName() + QDir::separator() +
           QCoreApplication::applicationName() + QDir::separator() +
           settingsFilename;
}

Settings::Settings(const QString &path)
    : QSettings{path.isEmpty() ? settingsFilepath() : path,
                QSettings::IniFormat} {
    qDebug() << "app:" << APP_ORG << APP_ID << APP_VERSION;
    qDebug() << "settings file:" << fileName();
    qDebug() << "cache location:" << cacheDir();
}

LoopcastLogger::LogType Settings::logLevel() const {
    auto str = value(QStringLiteral("log_level"), QStringLiteral("info"))
                   .toString()
                   .toLower()
                   .toStdString();
    auto level = LoopcastLogger::levelFromStr(str);
    if (!level) {
        qWarning() << "invalid log level:" << QString::fromStdString(str);
        return LoopcastLogger::LogType::Info;
    }
    return *level;
}

QString Settings::logFile() const {
    return value(QStringLiteral("log_file")).toString();
}

int Settings::portMin() const {
    return std::clamp(value(QStringLiteral("stream/port_min"), 9000).toInt(),
                      1, 65535);
}

int Settings::portMax() const {
    return std::clamp(value(QStringLiteral("stream/port_max"), 9099).toInt(),
                      1, 65535);
}

QString Settings::streamAddress() const {
    return value(QStringLiteral("stream/address")).toString();
}

QString Settings::cacheDir() const {
    auto path = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    if (!QFile::exists(path)) QDir::root().mkpath(path);
    return path;
}

QString Settings::scratchDir() const {
    auto dir = value(QStringLiteral("stream/scratch_dir")).toString();
    if (dir.isEmpty()) return QDir{cacheDir()}.filePath(QStringLiteral("streams"));
    return dir;
}

int Settings::discoveryInterval() const {
    return std::max(1, value(QStringLiteral("discovery/interval"), 10).toInt());
}

int Settings::discoveryTimeout() const {
    return std::max(1, value(QStringLiteral("discovery/timeout"), 3).toInt());
}

QString Settings::searchTarget() const {
    return value(QStringLiteral("discovery/search_target"),
                 DiscoveryClient::defaultSearchTarget)
        .toString();
}

int Settings::mx() const {
    return std::clamp(value(QStringLiteral("discovery/mx"), 3).toInt(), 1, 5);
}

int Settings::ttl() const {
    return std::max(1, value(QStringLiteral("discovery/ttl"), 30).toInt());
}

int Settings::controlTimeout() const {
    return std::max(100,
                    value(QStringLiteral("control/timeout"), 5000).toInt());
}

int Settings::controlRetries() const {
    return std::max(0, value(QStringLiteral("control/retries"), 2).toInt());
}

int Settings::controlRetryDelay() const {
    return std::max(0,
                    value(QStringLiteral("control/retry_delay"), 500).toInt());
}

int Settings::pollInterval() const {
    return std::max(
        100, value(QStringLiteral("monitor/poll_interval"), 4000).toInt());
}

int Settings::failureThreshold() const {
    return std::max(
        1, value(QStringLiteral("monitor/failure_threshold"), 3).toInt());
}

int Settings::backoffCeiling() const {
    return std::max(pollInterval(),
                    value(QStringLiteral("monitor/backoff_ceiling"), 30000)
                        .toInt());
}

QString Settings::autoPlayConfig() const {
    auto path = value(QStringLiteral("autoplay/config")).toString();
    if (path.isEmpty() || QDir::isAbsolutePath(path)) return path;
    return QFileInfo{fileName()}.absoluteDir().filePath(path);
}

int Settings::autoPlayRetryDelay() const {
    return std::max(0,
                    value(QStringLiteral("autoplay/retry_delay"), 30).toInt());
}

StreamServer::Config Settings::streamServerConfig() const {
    StreamServer::Config config;
    config.portMin = static_cast<quint16>(portMin());
    config.portMax = static_cast<quint16>(portMax());
    config.address = streamAddress();
    config.scratchDir = scratchDir();
    return config;
}

DiscoveryClient::Config Settings::discoveryConfig() const {
    DiscoveryClient::Config config;
    config.searchTarget = searchTarget();
    config.mx = mx();
    config.descriptionTimeout = discoveryTimeout() * 1000;
    return config;
}

AvTransportClient::Options Settings::controlOptions() const {
    AvTransportClient::Options options;
    options.timeout = controlTimeout();
    options.retries = controlRetries();
    options.retryDelay = controlRetryDelay();
    return options;
}

DeviceManager::Config Settings::managerConfig() const {
    DeviceManager::Config config;
    config.discoveryInterval = discoveryInterval() * 1000;
    config.discoveryTimeout = discoveryTimeout() * 1000;
    config.ttl = ttl();
    config.autoPlayRetryDelay = autoPlayRetryDelay();
    config.monitor.pollInterval = pollInterval();
    config.monitor.failureThreshold = failureThreshold();
    config.monitor.backoffCeiling = backoffCeiling();
    return config;
}
