/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef PLAYBACKMONITOR_H
#define PLAYBACKMONITOR_H

#include <QMutex>
#include <QObject>
#include <QString>
#include <QThread>
#include <QUrl>
#include <QWaitCondition>
#include <atomic>
#include <functional>

#include "avtransportclient.h"
#include "deviceregistry.h"

/*
 * Supervises playback on one device while it is in Playing state.
 *
 * Polls transport state and restarts the media when the device stops and
 * looping is enabled. Consecutive failures back off exponentially and after
 * failureThreshold of them the device is marked unreachable. Any registry
 * write requires the device to still be playing the monitored stream.
 */
class PlaybackMonitor : public QThread {
    Q_OBJECT

   public:
    enum class Outcome { Continue, Ended };

    struct Config {
        int pollInterval = 4000;     // 4s
        int failureThreshold = 3;
        int backoffCeiling = 30000;  // 30s
    };

    using ReleaseHandler = std::function<void(const QUrl &)>;

    PlaybackMonitor(QString deviceId, QString mediaPath,
                    AvTransportClient::MediaInfo media, Config config,
                    DeviceRegistry &registry, AvTransportClient &control,
                    ReleaseHandler releaseStream, QObject *parent = nullptr);
    ~PlaybackMonitor() override;

    // Single polling cycle.
    Outcome poll();
    void cancel();
    bool cancelled() const;
    int nextDelay() const;
    static int backoffDelay(int pollInterval, int failures, int ceiling);

    inline const QString &deviceId() const { return m_deviceId; }
    inline const QString &mediaPath() const { return m_mediaPath; }
    inline int failures() const { return m_failures; }

   protected:
    void run() override;

   private:
    QString m_deviceId;
    QString m_mediaPath;
    AvTransportClient::MediaInfo m_media;
    Config m_config;
    DeviceRegistry &m_registry;
    AvTransportClient &m_control;
    ReleaseHandler m_releaseStream;
    std::atomic_int m_failures{0};
    std::atomic_bool m_cancelled{false};
    mutable QMutex m_mutex;
    QWaitCondition m_cond;

    bool owns(const DeviceRecord &record) const;
    Outcome restart(const DeviceRecord &record);
    Outcome handleFailure(const QString &reason);
    Outcome end(DeviceStatus status, bool releaseStream);
    void resetFailures();
};

#endif  // PLAYBACKMONITOR_H
