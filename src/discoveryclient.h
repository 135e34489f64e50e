/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DISCOVERYCLIENT_H
#define DISCOVERYCLIENT_H

#include <QByteArray>
#include <QDateTime>
#include <QDebug>
#include <QString>
#include <QUrl>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

struct DeviceDescriptor {
    QString udn;
    QString friendlyName;
    QString manufacturer;
    QString modelName;
    QString deviceType;
    QString usn;
    QUrl locationUrl;
    QUrl controlUrl;
    QString serviceType;
    QString host;
    int port = 0;
    qint64 latencyMs = -1;
    QDateTime seenAt;

    friend QDebug operator<<(QDebug debug, const DeviceDescriptor &desc);
};

class DiscoveryClient {
   public:
    static const QString avTransportType;
    static const QString defaultSearchTarget;

    struct Config {
        QString searchTarget = defaultSearchTarget;
        int mx = 3;
        int descriptionTimeout = 3000;  // 3s
    };

    struct Datagram {
        QByteArray data;
        QString sender;
        qint64 latencyMs = 0;  // since the search was sent
    };

    struct SsdpReply {
        QUrl location;
        QString usn;
        QString st;
        QString server;
        QString sender;
        qint64 latencyMs = 0;
        // uuid part of USN, or location when USN is missing
        QString key() const;
    };

    // Network side of discovery. The default one speaks SSDP over UDP
    // multicast and fetches descriptions over HTTP.
    class Transport {
       public:
        virtual ~Transport() = default;
        virtual std::vector<Datagram> search(const QByteArray &request,
                                             int timeout) = 0;
        virtual std::optional<QByteArray> fetchDescription(const QUrl &location,
                                                           int timeout) = 0;
    };

    // return false to stop iteration
    using Visitor = std::function<bool(const DeviceDescriptor &)>;

    explicit DiscoveryClient(Config config = {},
                             std::shared_ptr<Transport> transport = {});

    void discover(int timeout, const Visitor &visitor);
    std::vector<DeviceDescriptor> discover(int timeout);

    inline const Config &config() const { return m_config; }

    static QByteArray searchRequest(const QString &searchTarget, int mx);
    static std::optional<SsdpReply> parseReply(const QByteArray &data);
    static std::optional<DeviceDescriptor> parseDescription(const QUrl &location,
                                                            const QByteArray &xml);

   private:
    Config m_config;
    std::shared_ptr<Transport> m_transport;

    bool matchesSearchTarget(const QString &st) const;
    std::vector<SsdpReply> collectReplies(const std::vector<Datagram> &datagrams,
                                          const QDateTime &searchTime,
                                          std::vector<QDateTime> &seenTimes) const;
};

class SsdpTransport : public DiscoveryClient::Transport {
   public:
    static const QString ssdpAddress;
    static const quint16 ssdpPort = 1900;
    std::vector<DiscoveryClient::Datagram> search(const QByteArray &request,
                                                  int timeout) override;
    std::optional<QByteArray> fetchDescription(const QUrl &location,
                                               int timeout) override;
};

#endif  // DISCOVERYCLIENT_H
