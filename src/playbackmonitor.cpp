/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "playbackmonitor.h"

#include <QDateTime>
#include <QDebug>
#include <algorithm>

#include "errors.h"

PlaybackMonitor::PlaybackMonitor(QString deviceId, QString mediaPath,
                                 AvTransportClient::MediaInfo media,
                                 Config config, DeviceRegistry &registry,
                                 AvTransportClient &control,
                                 ReleaseHandler releaseStream, QObject *parent)
    : QThread{parent}, m_deviceId{std::move(deviceId)},
      m_mediaPath{std::move(mediaPath)}, m_media{std::move(media)},
      m_config{config}, m_registry{registry}, m_control{control},
      m_releaseStream{std::move(releaseStream)} {}

PlaybackMonitor::~PlaybackMonitor() {
    cancel();
    wait();
}

int PlaybackMonitor::backoffDelay(int pollInterval, int failures,
                                  int ceiling) {
    qint64 delay = pollInterval;
    for (int i = 0; i < failures && delay < ceiling; ++i) delay *= 2;
    return static_cast<int>(std::min<qint64>(delay, ceiling));
}

int PlaybackMonitor::nextDelay() const {
    return backoffDelay(m_config.pollInterval, m_failures,
                        m_config.backoffCeiling);
}

void PlaybackMonitor::cancel() {
    {
        QMutexLocker locker{&m_mutex};
        m_cancelled = true;
    }
    m_cond.wakeAll();
    requestInterruption();
}

bool PlaybackMonitor::cancelled() const { return m_cancelled; }

void PlaybackMonitor::run() {
    qDebug() << "playback monitor started:" << m_deviceId << m_mediaPath;

    while (true) {
        {
            QMutexLocker locker{&m_mutex};
            if (!m_cancelled)
                m_cond.wait(&m_mutex, static_cast<unsigned long>(nextDelay()));
            if (m_cancelled) break;
        }

        if (poll() == Outcome::Ended) break;
    }

    qDebug() << "playback monitor ended:" << m_deviceId;
}

bool PlaybackMonitor::owns(const DeviceRecord &record) const {
    return record.playing(m_mediaPath) && record.streamUrl == m_media.url;
}

PlaybackMonitor::Outcome PlaybackMonitor::poll() {
    if (cancelled()) return Outcome::Ended;

    auto record = m_registry.get(m_deviceId);
    if (!record || !owns(*record)) {
        qDebug() << "device no longer plays monitored media:" << m_deviceId;
        return Outcome::Ended;
    }

    AvTransportClient::TransportInfo info;
    try {
        info = m_control.getTransportInfo(record->controlUrl,
                                          record->serviceType);
    } catch (const LoopcastError &err) {
        if (cancelled()) return Outcome::Ended;
        return handleFailure(err.message());
    }

    if (cancelled()) return Outcome::Ended;

    switch (info.state) {
        case TransportState::Playing:
        case TransportState::Transitioning:
            resetFailures();
            return Outcome::Continue;
        case TransportState::Stopped:
        case TransportState::NoMediaPresent:
            if (record->isLooping) return restart(*record);
            qDebug() << "playback finished:" << m_deviceId;
            return end(DeviceStatus::Stopped, true);
        case TransportState::PausedPlayback:
            qDebug() << "playback paused on device:" << m_deviceId;
            return end(DeviceStatus::Paused, false);
        case TransportState::Unknown:
            break;
    }

    return handleFailure(
        QStringLiteral("unknown transport state: %1").arg(info.rawState));
}

PlaybackMonitor::Outcome PlaybackMonitor::restart(const DeviceRecord &record) {
    qDebug() << "restarting media on device:" << m_deviceId;

    try {
        m_control.setTransportUri(record.controlUrl, m_media,
                                  record.serviceType);
        if (cancelled()) return Outcome::Ended;
        m_control.play(record.controlUrl, record.serviceType);
    } catch (const LoopcastError &err) {
        if (cancelled()) return Outcome::Ended;
        return handleFailure(err.message());
    }

    if (cancelled()) return Outcome::Ended;

    const auto now = QDateTime::currentDateTimeUtc();
    if (!m_registry.update(m_deviceId, [&](DeviceRecord &r) {
            if (!owns(r)) return false;
            ++r.restartCount;
            r.consecutiveFailures = 0;
            r.lastCommandAt = now;
            return true;
        })) {
        return Outcome::Ended;
    }

    m_failures = 0;
    return Outcome::Continue;
}

void PlaybackMonitor::resetFailures() {
    if (m_failures == 0) return;
    m_failures = 0;
    m_registry.update(m_deviceId, [&](DeviceRecord &r) {
        if (!owns(r)) return false;
        r.consecutiveFailures = 0;
        return true;
    });
}

PlaybackMonitor::Outcome PlaybackMonitor::handleFailure(
    const QString &reason) {
    const int failures = ++m_failures;

    qWarning() << "playback poll failed:" << m_deviceId << reason << failures
               << "/" << m_config.failureThreshold;

    if (!m_registry.update(m_deviceId, [&](DeviceRecord &r) {
            if (!owns(r)) return false;
            r.consecutiveFailures = failures;
            return true;
        })) {
        return Outcome::Ended;
    }

    if (failures < m_config.failureThreshold) return Outcome::Continue;

    qWarning() << "device unreachable:" << m_deviceId;
    return end(DeviceStatus::Unreachable, true);
}

PlaybackMonitor::Outcome PlaybackMonitor::end(DeviceStatus status,
                                              bool releaseStream) {
    QUrl url;

    const bool updated = m_registry.update(m_deviceId, [&](DeviceRecord &r) {
        if (!owns(r)) return false;
        r.status = status;
        if (releaseStream) {
            url = r.streamUrl;
            r.streamUrl.clear();
            if (status == DeviceStatus::Stopped) r.currentVideo.clear();
        }
        return true;
    });

    if (updated && !url.isEmpty() && m_releaseStream) m_releaseStream(url);

    return Outcome::Ended;
}
