/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "discoveryclient.h"

#include <QElapsedTimer>
#include <QHash>
#include <QHostAddress>
#include <QNetworkDatagram>
#include <QRegExp>
#include <QThread>
#include <QUdpSocket>
#include <algorithm>
#include <libupnpp/control/description.hxx>

#include "errors.h"
#include "httpclient.h"

const QString DiscoveryClient::avTransportType =
    QStringLiteral("urn:schemas-upnp-org:service:AVTransport:");
const QString DiscoveryClient::defaultSearchTarget =
    QStringLiteral("urn:schemas-upnp-org:service:AVTransport:1");
const QString SsdpTransport::ssdpAddress = QStringLiteral("239.255.255.250");

QDebug operator<<(QDebug debug, const DeviceDescriptor &desc) {
    QDebugStateSaver saver{debug};
    debug.nospace() << "friendly-name=" << desc.friendlyName
                    << ", udn=" << desc.udn
                    << ", manufacturer=" << desc.manufacturer
                    << ", location=" << desc.locationUrl.toString()
                    << ", control-url=" << desc.controlUrl.toString()
                    << ", latency=" << desc.latencyMs;
    return debug;
}

QString DiscoveryClient::SsdpReply::key() const {
    if (!usn.isEmpty()) return usn.section(QStringLiteral("::"), 0, 0);
    return location.toString();
}

DiscoveryClient::DiscoveryClient(Config config,
                                 std::shared_ptr<Transport> transport)
    : m_config{std::move(config)}, m_transport{std::move(transport)} {
    if (!m_transport) m_transport = std::make_shared<SsdpTransport>();
}

QByteArray DiscoveryClient::searchRequest(const QString &searchTarget, int mx) {
    return QStringLiteral(
               "M-SEARCH * HTTP/1.1\r\n"
               "HOST: %1:%2\r\n"
               "MAN: \"ssdp:discover\"\r\n"
               "MX: %3\r\n"
               "ST: %4\r\n"
               "\r\n")
        .arg(SsdpTransport::ssdpAddress)
        .arg(SsdpTransport::ssdpPort)
        .arg(mx)
        .arg(searchTarget)
        .toLatin1();
}

std::optional<DiscoveryClient::SsdpReply> DiscoveryClient::parseReply(
    const QByteArray &data) {
    const auto lines =
        QString::fromUtf8(data).split(QRegExp{QStringLiteral("\r?\n")});

    if (lines.isEmpty() ||
        !lines.first().trimmed().startsWith(QStringLiteral("HTTP/1."),
                                            Qt::CaseInsensitive) ||
        lines.first().section(' ', 1, 1) != QStringLiteral("200")) {
        qDebug() << "not a search response:" << lines.value(0);
        return std::nullopt;
    }

    QHash<QString, QString> headers;
    for (int i = 1; i < lines.size(); ++i) {
        const auto &line = lines.at(i);
        auto idx = line.indexOf(':');
        if (idx <= 0) continue;
        headers.insert(line.left(idx).trimmed().toLower(),
                       line.mid(idx + 1).trimmed());
    }

    SsdpReply reply;
    reply.location = QUrl{headers.value(QStringLiteral("location"))};
    reply.usn = headers.value(QStringLiteral("usn"));
    reply.st = headers.value(QStringLiteral("st"));
    reply.server = headers.value(QStringLiteral("server"));

    if (!reply.location.isValid() || reply.location.host().isEmpty() ||
        !reply.location.scheme().startsWith(QStringLiteral("http"))) {
        qWarning() << "search response without valid location";
        return std::nullopt;
    }

    return reply;
}

static const UPnPClient::UPnPServiceDesc *findAvTransport(
    const UPnPClient::UPnPDeviceDesc &ddesc,
    const UPnPClient::UPnPDeviceDesc **owner) {
    for (const auto &sdesc : ddesc.services) {
        if (QString::fromStdString(sdesc.serviceType)
                .startsWith(DiscoveryClient::avTransportType)) {
            *owner = &ddesc;
            return &sdesc;
        }
    }

    for (const auto &edesc : ddesc.embedded) {
        if (const auto *sdesc = findAvTransport(edesc, owner)) return sdesc;
    }

    return nullptr;
}

std::optional<DeviceDescriptor> DiscoveryClient::parseDescription(
    const QUrl &location, const QByteArray &xml) {
    UPnPClient::UPnPDeviceDesc ddesc{location.toString().toStdString(),
                                     xml.toStdString()};
    if (!ddesc.ok) {
        qWarning() << "invalid device description:" << location;
        return std::nullopt;
    }

    const UPnPClient::UPnPDeviceDesc *owner = nullptr;
    const auto *sdesc = findAvTransport(ddesc, &owner);
    if (!sdesc) {
        qDebug() << "device has no av-transport service:"
                 << QString::fromStdString(ddesc.friendlyName);
        return std::nullopt;
    }

    auto pick = [](const std::string &root, const std::string &dev) {
        return QString::fromStdString(root.empty() ? dev : root);
    };

    DeviceDescriptor desc;
    desc.udn = pick(ddesc.UDN, owner->UDN);
    desc.friendlyName = pick(ddesc.friendlyName, owner->friendlyName);
    desc.manufacturer = pick(ddesc.manufacturer, owner->manufacturer);
    desc.modelName = pick(ddesc.modelName, owner->modelName);
    desc.deviceType = QString::fromStdString(owner->deviceType);
    desc.serviceType = QString::fromStdString(sdesc->serviceType);
    desc.locationUrl = location;
    desc.host = location.host();
    desc.port = location.port(80);

    QUrl base{QString::fromStdString(ddesc.URLBase)};
    if (!base.isValid() || base.host().isEmpty()) base = location;
    desc.controlUrl =
        base.resolved(QUrl{QString::fromStdString(sdesc->controlURL)});

    if (desc.controlUrl.host().isEmpty() ||
        QString::fromStdString(sdesc->controlURL).isEmpty()) {
        qWarning() << "av-transport service without control url:"
                   << desc.friendlyName;
        return std::nullopt;
    }

    return desc;
}

bool DiscoveryClient::matchesSearchTarget(const QString &st) const {
    if (st.compare(m_config.searchTarget, Qt::CaseInsensitive) == 0)
        return true;

    if (m_config.searchTarget == QStringLiteral("ssdp:all"))
        return st.contains(QStringLiteral("AVTransport"),
                           Qt::CaseInsensitive) ||
               st.contains(QStringLiteral("MediaRenderer"),
                           Qt::CaseInsensitive);

    return false;
}

std::vector<DiscoveryClient::SsdpReply> DiscoveryClient::collectReplies(
    const std::vector<Datagram> &datagrams, const QDateTime &searchTime,
    std::vector<QDateTime> &seenTimes) const {
    std::vector<SsdpReply> replies;
    QHash<QString, size_t> index;

    for (const auto &datagram : datagrams) {
        auto reply = parseReply(datagram.data);
        if (!reply) continue;

        if (!matchesSearchTarget(reply->st)) {
            qDebug() << "ignoring reply with st:" << reply->st;
            continue;
        }

        reply->sender = datagram.sender;
        reply->latencyMs = datagram.latencyMs;
        auto seenAt = searchTime.addMSecs(datagram.latencyMs);

        const auto key = reply->key();
        if (auto it = index.find(key); it != index.end()) {
            auto &known = replies[it.value()];
            if (reply->latencyMs < known.latencyMs) {
                known = *reply;
            }
            seenTimes[it.value()] = std::max(seenTimes[it.value()], seenAt);
        } else {
            index.insert(key, replies.size());
            replies.push_back(*reply);
            seenTimes.push_back(seenAt);
        }
    }

    return replies;
}

void DiscoveryClient::discover(int timeout, const Visitor &visitor) {
    const auto searchTime = QDateTime::currentDateTimeUtc();
    const auto datagrams = m_transport->search(
        searchRequest(m_config.searchTarget, m_config.mx), timeout);

    std::vector<QDateTime> seenTimes;
    const auto replies = collectReplies(datagrams, searchTime, seenTimes);

    qDebug() << "search replies:" << datagrams.size()
             << "unique:" << replies.size();

    for (size_t i = 0; i < replies.size(); ++i) {
        const auto &reply = replies[i];

        auto xml =
            m_transport->fetchDescription(reply.location,
                                          m_config.descriptionTimeout);
        if (!xml) {
            qWarning() << "failed to fetch device description:"
                       << reply.location;
            continue;
        }

        auto desc = parseDescription(reply.location, *xml);
        if (!desc) continue;

        desc->usn = reply.usn;
        desc->latencyMs = reply.latencyMs;
        desc->seenAt = seenTimes[i];

        qDebug() << "device found:" << *desc;

        if (!visitor(*desc)) break;
    }
}

std::vector<DeviceDescriptor> DiscoveryClient::discover(int timeout) {
    std::vector<DeviceDescriptor> devices;
    discover(timeout, [&devices](const DeviceDescriptor &desc) {
        devices.push_back(desc);
        return true;
    });
    return devices;
}

std::vector<DiscoveryClient::Datagram> SsdpTransport::search(
    const QByteArray &request, int timeout) {
    QUdpSocket socket;
    if (!socket.bind(QHostAddress::AnyIPv4, 0, QUdpSocket::ShareAddress)) {
        throw NetworkError{QStringLiteral("failed to bind ssdp socket: %1")
                               .arg(socket.errorString())};
    }

    socket.setSocketOption(QAbstractSocket::MulticastTtlOption, 4);

    QElapsedTimer clock;
    clock.start();

    // sent twice because of possible udp packet loss
    for (int i = 0; i < 2; ++i) {
        if (socket.writeDatagram(request, QHostAddress{ssdpAddress}, ssdpPort) <
            0) {
            qWarning() << "failed to send m-search:" << socket.errorString();
        }
    }

    std::vector<DiscoveryClient::Datagram> datagrams;

    while (!QThread::currentThread()->isInterruptionRequested()) {
        const auto remaining = timeout - clock.elapsed();
        if (remaining <= 0) break;

        if (!socket.waitForReadyRead(
                static_cast<int>(std::min<qint64>(remaining, 100))))
            continue;

        while (socket.hasPendingDatagrams()) {
            auto datagram = socket.receiveDatagram();
            datagrams.push_back({datagram.data(),
                                 datagram.senderAddress().toString(),
                                 clock.elapsed()});
        }
    }

    return datagrams;
}

std::optional<QByteArray> SsdpTransport::fetchDescription(const QUrl &location,
                                                          int timeout) {
    auto response = HttpClient::get(location, {}, timeout);
    if (response.error != QNetworkReply::NoError || response.body.isEmpty())
        return std::nullopt;
    return response.body;
}
