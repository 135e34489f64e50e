/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DEVICEMANAGER_H
#define DEVICEMANAGER_H

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QUrl>
#include <memory>
#include <optional>
#include <vector>

#include "autoplayconfig.h"
#include "avtransportclient.h"
#include "deviceregistry.h"
#include "discoveryclient.h"
#include "errors.h"
#include "playbackmonitor.h"
#include "streamserver.h"
#include "taskexecutor.h"

/*
 * Coordinates discovery, playback commands, streaming sessions and playback
 * monitors.
 *
 * Commands for one device are serialized. Each device has at most one running
 * monitor. Playing the media a device already plays only updates the loop
 * flag.
 */
class DeviceManager : public TaskExecutor {
   public:
    struct Config {
        int discoveryInterval = 10000;  // 10s
        int discoveryTimeout = 3000;    // 3s
        int ttl = 30;                   // secs
        int autoPlayRetryDelay = 30;    // secs
        int autoPlayThreads = 4;
        PlaybackMonitor::Config monitor;
    };

    DeviceManager(Config config, std::shared_ptr<DiscoveryClient> discovery,
                  std::shared_ptr<AvTransportClient> control,
                  std::shared_ptr<StreamServer> streamServer);
    ~DeviceManager();

    void startDiscovery(int interval = -1);
    void stopDiscovery();
    bool discoveryActive() const;
    void runDiscoveryCycle();

    std::vector<DeviceRecord> listDevices() const;
    std::optional<DeviceRecord> findDevice(const QString &nameOrId) const;
    Result getStatus(const QString &deviceId, DeviceRecord &record) const;

    Result play(const QString &deviceId, const QString &mediaPath, bool loop);
    Result pause(const QString &deviceId);
    Result stop(const QString &deviceId);
    Result seek(const QString &deviceId, int position);

    void loadAutoPlayConfig(AutoPlayConfig config);
    Result loadAutoPlayConfigFile(const QString &path);

    int activeMonitorCount() const;
    void shutdown();

    inline DeviceRegistry &registry() { return m_registry; }
    inline const Config &config() const { return m_config; }

   private:
    class DiscoveryLoop;

    Config m_config;
    std::shared_ptr<DiscoveryClient> m_discovery;
    std::shared_ptr<AvTransportClient> m_control;
    std::shared_ptr<StreamServer> m_streamServer;
    DeviceRegistry m_registry;

    mutable QMutex m_locksMutex;
    QHash<QString, std::shared_ptr<QMutex>> m_commandLocks;

    mutable QMutex m_monitorsMutex;
    QHash<QString, std::shared_ptr<PlaybackMonitor>> m_monitors;

    mutable QMutex m_autoPlayMutex;
    std::shared_ptr<const AutoPlayConfig> m_autoPlay;
    QSet<QString> m_pendingAutoPlay;
    QHash<QString, QDateTime> m_autoPlayFailures;
    QSet<QString> m_reportedProblems;

    mutable QMutex m_loopMutex;
    std::unique_ptr<DiscoveryLoop> m_discoveryLoop;

    std::shared_ptr<QMutex> commandLock(const QString &deviceId);
    Result playInternal(const QString &deviceId, const QString &mediaPath,
                        bool loop, bool user);
    AvTransportClient::MediaInfo mediaInfo(const QString &mediaPath,
                                           const QUrl &url) const;
    void startMonitor(const QString &deviceId, const QString &mediaPath,
                      const AvTransportClient::MediaInfo &media);
    void resumeMonitor(const QString &deviceId);
    void stopMonitor(const QString &deviceId);
    void stopAllMonitors();
    bool checkReachable(const DeviceRecord &record) const;
    void verifyDevices(const std::vector<QString> &ids);
    void cleanupUnreachable(const QString &deviceId);
    void applyAutoPlay();
    void reportOnce(const QString &key, const LoopcastError &err);
};

#endif  // DEVICEMANAGER_H
