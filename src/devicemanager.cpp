/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "devicemanager.h"

#include <QDebug>
#include <QFileInfo>
#include <QThread>
#include <QWaitCondition>
#include <algorithm>

#include "utils.h"

class DeviceManager::DiscoveryLoop : public QThread {
   public:
    DiscoveryLoop(DeviceManager &manager, int interval)
        : m_manager{manager}, m_interval{interval} {}

    void cancel() {
        {
            QMutexLocker locker{&m_mutex};
            m_cancelled = true;
        }
        m_cond.wakeAll();
        requestInterruption();
    }

    void setInterval(int interval) {
        QMutexLocker locker{&m_mutex};
        m_interval = interval;
    }

   protected:
    void run() override {
        qDebug() << "discovery loop started";

        while (true) {
            m_manager.runDiscoveryCycle();

            QMutexLocker locker{&m_mutex};
            if (!m_cancelled)
                m_cond.wait(&m_mutex, static_cast<unsigned long>(m_interval));
            if (m_cancelled) break;
        }

        qDebug() << "discovery loop ended";
    }

   private:
    DeviceManager &m_manager;
    int m_interval;
    bool m_cancelled = false;
    QMutex m_mutex;
    QWaitCondition m_cond;
};

DeviceManager::DeviceManager(Config config,
                             std::shared_ptr<DiscoveryClient> discovery,
                             std::shared_ptr<AvTransportClient> control,
                             std::shared_ptr<StreamServer> streamServer)
    : TaskExecutor{nullptr, std::max(1, config.autoPlayThreads)},
      m_config{std::move(config)}, m_discovery{std::move(discovery)},
      m_control{std::move(control)}, m_streamServer{std::move(streamServer)} {
    if (!m_discovery) m_discovery = std::make_shared<DiscoveryClient>();
    if (!m_control) m_control = std::make_shared<AvTransportClient>();
    if (!m_streamServer) m_streamServer = std::make_shared<StreamServer>();
}

DeviceManager::~DeviceManager() { shutdown(); }

std::shared_ptr<QMutex> DeviceManager::commandLock(const QString &deviceId) {
    QMutexLocker locker{&m_locksMutex};
    auto &lock = m_commandLocks[deviceId];
    if (!lock) lock = std::make_shared<QMutex>();
    return lock;
}

void DeviceManager::startDiscovery(int interval) {
    if (interval <= 0) interval = m_config.discoveryInterval;

    QMutexLocker locker{&m_loopMutex};

    if (m_discoveryLoop && m_discoveryLoop->isRunning()) {
        m_discoveryLoop->setInterval(interval);
        return;
    }

    qDebug() << "starting discovery, interval:" << interval;

    m_discoveryLoop = std::make_unique<DiscoveryLoop>(*this, interval);
    m_discoveryLoop->start();
}

void DeviceManager::stopDiscovery() {
    QMutexLocker locker{&m_loopMutex};

    if (!m_discoveryLoop) return;

    qDebug() << "stopping discovery";

    m_discoveryLoop->cancel();
    m_discoveryLoop->wait();
    m_discoveryLoop.reset();
}

bool DeviceManager::discoveryActive() const {
    QMutexLocker locker{&m_loopMutex};
    return m_discoveryLoop && m_discoveryLoop->isRunning();
}

void DeviceManager::runDiscoveryCycle() {
    std::vector<QString> found;

    try {
        m_discovery->discover(
            m_config.discoveryTimeout, [&](const DeviceDescriptor &desc) {
                if (QThread::currentThread()->isInterruptionRequested())
                    return false;
                auto seenAt = desc.seenAt.isValid()
                                  ? desc.seenAt
                                  : QDateTime::currentDateTimeUtc();
                found.push_back(m_registry.upsert(desc, seenAt).id);
                return true;
            });
    } catch (const LoopcastError &err) {
        qWarning() << "discovery failed:" << err.type() << err.message();
    }

    if (QThread::currentThread()->isInterruptionRequested()) return;

    verifyDevices(found);

    auto expired = m_registry.sweepExpired(
        QDateTime::currentDateTimeUtc(), m_config.ttl,
        [this](const DeviceRecord &record) { return checkReachable(record); });
    for (const auto &id : expired) cleanupUnreachable(id);

    if (QThread::currentThread()->isInterruptionRequested()) return;

    applyAutoPlay();

    qDebug() << "discovery cycle done, devices:" << m_registry.size();
}

bool DeviceManager::checkReachable(const DeviceRecord &record) const {
    try {
        m_control->getTransportInfo(record.controlUrl, record.serviceType);
        return true;
    } catch (const LoopcastError &err) {
        qDebug() << "device reachability check failed:" << record.id << err.message();
    }
    return false;
}

void DeviceManager::verifyDevices(const std::vector<QString> &ids) {
    auto needsVerification = [](const DeviceRecord &record) {
        return record.status == DeviceStatus::Discovered ||
               record.status == DeviceStatus::Unreachable;
    };

    for (const auto &id : ids) {
        auto record = m_registry.get(id);
        if (!record || !needsVerification(*record)) continue;

        if (!checkReachable(*record)) continue;

        if (m_registry.transition(id, DeviceStatus::Connected,
                                  needsVerification)) {
            qDebug() << "device connected:" << record->friendlyName << id;
        }
    }
}

void DeviceManager::cleanupUnreachable(const QString &deviceId) {
    auto lock = commandLock(deviceId);
    QMutexLocker locker{lock.get()};

    stopMonitor(deviceId);

    QUrl url;
    m_registry.update(deviceId, [&](DeviceRecord &record) {
        if (record.status != DeviceStatus::Unreachable) return false;
        url = record.streamUrl;
        record.streamUrl.clear();
        return !url.isEmpty();
    });

    if (!url.isEmpty()) m_streamServer->release(url);

    qWarning() << "device expired:" << deviceId;
}

std::vector<DeviceRecord> DeviceManager::listDevices() const {
    return m_registry.list();
}

std::optional<DeviceRecord> DeviceManager::findDevice(
    const QString &nameOrId) const {
    if (auto record = m_registry.get(nameOrId)) return record;
    return m_registry.findByName(nameOrId);
}

Result DeviceManager::getStatus(const QString &deviceId,
                                DeviceRecord &record) const {
    auto found = m_registry.get(deviceId);
    if (!found) return Result::fromError(DeviceNotFound{deviceId});
    record = *found;
    return {};
}

AvTransportClient::MediaInfo DeviceManager::mediaInfo(const QString &mediaPath,
                                                      const QUrl &url) const {
    AvTransportClient::MediaInfo media;
    media.url = url;
    media.title = QFileInfo{mediaPath}.completeBaseName();
    media.mime = Utils::mimeFromPath(mediaPath);

    if (auto session = m_streamServer->session(url);
        session && !session->subtitleUrl.isEmpty()) {
        media.subtitleUrl = session->subtitleUrl;
        media.subtitleMime = Utils::mimeFromPath(session->subtitlePath);
    }

    return media;
}

Result DeviceManager::play(const QString &deviceId, const QString &mediaPath,
                           bool loop) {
    return playInternal(deviceId, mediaPath, loop, true);
}

Result DeviceManager::playInternal(const QString &deviceId,
                                   const QString &mediaPath, bool loop,
                                   bool user) {
    auto lock = commandLock(deviceId);
    QMutexLocker locker{lock.get()};

    auto record = m_registry.get(deviceId);
    if (!record) return Result::fromError(DeviceNotFound{deviceId});

    auto path = Utils::canonicalPath(mediaPath);
    if (path.isEmpty()) return Result::fromError(MediaNotFound{mediaPath});

    if (!user && record->userControlled) {
        qDebug() << "device under user control, auto-play skipped:" << deviceId;
        return {};
    }

    if (record->playing(path)) {
        qDebug() << "device already plays media:" << deviceId << path;
        m_registry.update(deviceId, [&](DeviceRecord &r) {
            if (!r.playing(path)) return false;
            r.isLooping = loop;
            if (user) r.userControlled = true;
            return true;
        });
        return {};
    }

    stopMonitor(deviceId);

    QUrl url;
    try {
        url = m_streamServer->serve(path, Utils::localAddressFor(record->ip));
    } catch (const LoopcastError &err) {
        qWarning() << "cannot serve media:" << err.message();
        resumeMonitor(deviceId);
        return Result::fromError(err);
    }

    auto media = mediaInfo(path, url);

    try {
        m_control->setTransportUri(record->controlUrl, media,
                                   record->serviceType);
        m_control->play(record->controlUrl, record->serviceType);
    } catch (const LoopcastError &err) {
        qWarning() << "play failed:" << deviceId << err.message();
        m_streamServer->release(url);
        resumeMonitor(deviceId);
        return Result::fromError(err);
    }

    QUrl oldUrl;
    const auto now = QDateTime::currentDateTimeUtc();
    bool updated = m_registry.update(deviceId, [&](DeviceRecord &r) {
        if (r.playing(path)) return false;
        oldUrl = r.streamUrl;
        r.status = DeviceStatus::Playing;
        r.currentVideo = path;
        r.streamUrl = url;
        r.isLooping = loop;
        r.consecutiveFailures = 0;
        r.restartCount = 0;
        r.lastCommandAt = now;
        if (user) r.userControlled = true;
        return true;
    });

    if (!updated) {
        m_streamServer->release(url);
        return {};
    }

    // serve() took a new reference, also when the old url is the same stream
    if (!oldUrl.isEmpty()) m_streamServer->release(oldUrl);

    startMonitor(deviceId, path, media);

    qDebug() << "playing:" << deviceId << path << url;

    return {};
}

Result DeviceManager::pause(const QString &deviceId) {
    auto lock = commandLock(deviceId);
    QMutexLocker locker{lock.get()};

    auto record = m_registry.get(deviceId);
    if (!record) return Result::fromError(DeviceNotFound{deviceId});

    stopMonitor(deviceId);

    try {
        m_control->pause(record->controlUrl, record->serviceType);
    } catch (const LoopcastError &err) {
        qWarning() << "pause failed:" << deviceId << err.message();
        resumeMonitor(deviceId);
        return Result::fromError(err);
    }

    const auto now = QDateTime::currentDateTimeUtc();
    m_registry.update(deviceId, [&](DeviceRecord &r) {
        r.status = DeviceStatus::Paused;
        r.userControlled = true;
        r.lastCommandAt = now;
        return true;
    });

    return {};
}

Result DeviceManager::stop(const QString &deviceId) {
    auto lock = commandLock(deviceId);
    QMutexLocker locker{lock.get()};

    auto record = m_registry.get(deviceId);
    if (!record) return Result::fromError(DeviceNotFound{deviceId});

    stopMonitor(deviceId);

    Result result;
    try {
        m_control->stop(record->controlUrl, record->serviceType);
    } catch (const LoopcastError &err) {
        qWarning() << "stop failed:" << deviceId << err.message();
        result = Result::fromError(err);
    }

    QUrl url;
    const auto now = QDateTime::currentDateTimeUtc();
    m_registry.update(deviceId, [&](DeviceRecord &r) {
        url = r.streamUrl;
        r.streamUrl.clear();
        r.currentVideo.clear();
        r.status = DeviceStatus::Stopped;
        r.userControlled = true;
        r.lastCommandAt = now;
        return true;
    });

    if (!url.isEmpty()) m_streamServer->release(url);

    return result;
}

Result DeviceManager::seek(const QString &deviceId, int position) {
    auto lock = commandLock(deviceId);
    QMutexLocker locker{lock.get()};

    auto record = m_registry.get(deviceId);
    if (!record) return Result::fromError(DeviceNotFound{deviceId});

    try {
        m_control->seek(record->controlUrl, std::max(0, position),
                        record->serviceType);
    } catch (const LoopcastError &err) {
        qWarning() << "seek failed:" << deviceId << err.message();
        return Result::fromError(err);
    }

    const auto now = QDateTime::currentDateTimeUtc();
    m_registry.update(deviceId, [&](DeviceRecord &r) {
        r.lastCommandAt = now;
        return true;
    });

    return {};
}

void DeviceManager::startMonitor(const QString &deviceId,
                                 const QString &mediaPath,
                                 const AvTransportClient::MediaInfo &media) {
    auto monitor = std::make_shared<PlaybackMonitor>(
        deviceId, mediaPath, media, m_config.monitor, m_registry, *m_control,
        [server = m_streamServer](const QUrl &url) { server->release(url); });

    std::shared_ptr<PlaybackMonitor> old;
    {
        QMutexLocker locker{&m_monitorsMutex};
        old = m_monitors.take(deviceId);
        m_monitors.insert(deviceId, monitor);
        monitor->start();
    }

    if (old) {
        qWarning() << "replacing playback monitor:" << deviceId;
        old->cancel();
        old->wait();
    }
}

void DeviceManager::resumeMonitor(const QString &deviceId) {
    auto record = m_registry.get(deviceId);
    if (!record || record->status != DeviceStatus::Playing ||
        record->streamUrl.isEmpty())
        return;

    startMonitor(deviceId, record->currentVideo,
                 mediaInfo(record->currentVideo, record->streamUrl));
}

void DeviceManager::stopMonitor(const QString &deviceId) {
    std::shared_ptr<PlaybackMonitor> monitor;
    {
        QMutexLocker locker{&m_monitorsMutex};
        monitor = m_monitors.take(deviceId);
    }

    if (monitor) {
        monitor->cancel();
        monitor->wait();
    }
}

void DeviceManager::stopAllMonitors() {
    QHash<QString, std::shared_ptr<PlaybackMonitor>> monitors;
    {
        QMutexLocker locker{&m_monitorsMutex};
        monitors.swap(m_monitors);
    }

    for (auto &monitor : monitors) monitor->cancel();
    for (auto &monitor : monitors) monitor->wait();
}

int DeviceManager::activeMonitorCount() const {
    QMutexLocker locker{&m_monitorsMutex};
    return static_cast<int>(
        std::count_if(m_monitors.cbegin(), m_monitors.cend(),
                      [](const auto &m) { return m->isRunning(); }));
}

void DeviceManager::loadAutoPlayConfig(AutoPlayConfig config) {
    qDebug() << "auto-play entries:" << config.entries().size();

    {
        QMutexLocker locker{&m_autoPlayMutex};
        m_autoPlay = std::make_shared<const AutoPlayConfig>(std::move(config));
        m_autoPlayFailures.clear();
        m_reportedProblems.clear();
    }

    for (const auto &record : m_registry.list()) {
        if (!record.userControlled) continue;
        m_registry.update(record.id, [](DeviceRecord &r) {
            r.userControlled = false;
            return true;
        });
    }
}

Result DeviceManager::loadAutoPlayConfigFile(const QString &path) {
    try {
        loadAutoPlayConfig(AutoPlayConfig::load(path));
    } catch (const ConfigError &err) {
        qWarning() << err.message();
        return Result::fromError(err);
    }
    return {};
}

void DeviceManager::reportOnce(const QString &key, const LoopcastError &err) {
    QMutexLocker locker{&m_autoPlayMutex};
    if (m_reportedProblems.contains(key)) return;
    m_reportedProblems.insert(key);
    qWarning() << "auto-play:" << err.type() << err.message();
}

void DeviceManager::applyAutoPlay() {
    std::shared_ptr<const AutoPlayConfig> config;
    {
        QMutexLocker locker{&m_autoPlayMutex};
        config = m_autoPlay;
    }

    if (!config || config->empty()) return;

    for (const auto &entry : config->entries()) {
        auto record = m_registry.findByName(entry.deviceName);
        if (!record) {
            reportOnce(
                "device:" + entry.deviceName,
                ConfigError{QStringLiteral("no device matches entry: %1")
                                .arg(entry.deviceName)});
            continue;
        }

        auto path = Utils::canonicalPath(entry.videoPath);
        if (path.isEmpty()) {
            reportOnce("media:" + entry.videoPath,
                       MediaNotFound{entry.videoPath});
            continue;
        }

        if (record->playing(path) || record->userControlled) continue;

        if (record->status != DeviceStatus::Connected &&
            record->status != DeviceStatus::Stopped &&
            record->status != DeviceStatus::Playing)
            continue;

        const auto id = record->id;
        const bool loop = entry.loop;

        {
            QMutexLocker locker{&m_autoPlayMutex};
            if (m_pendingAutoPlay.contains(id)) continue;
            auto it = m_autoPlayFailures.constFind(id);
            if (it != m_autoPlayFailures.cend() &&
                it.value().secsTo(QDateTime::currentDateTimeUtc()) <
                    m_config.autoPlayRetryDelay)
                continue;
            m_pendingAutoPlay.insert(id);
        }

        qDebug() << "auto-play:" << entry.deviceName << path;

        bool started = startTask([this, id, path, loop] {
            auto result = playInternal(id, path, loop, false);

            QMutexLocker locker{&m_autoPlayMutex};
            m_pendingAutoPlay.remove(id);
            if (result) {
                m_autoPlayFailures.remove(id);
            } else {
                qWarning() << "auto-play failed:" << id << result;
                m_autoPlayFailures.insert(id,
                                          QDateTime::currentDateTimeUtc());
            }
        });

        if (!started) {
            QMutexLocker locker{&m_autoPlayMutex};
            m_pendingAutoPlay.remove(id);
        }
    }
}

void DeviceManager::shutdown() {
    stopDiscovery();
    waitForDone();
    stopAllMonitors();
}
