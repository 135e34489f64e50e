/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "avtransportclient.h"

#include <QDomDocument>
#include <QDomNode>
#include <QElapsedTimer>
#include <QHash>
#include <QStringList>
#include <QThread>
#include <algorithm>

#include "errors.h"
#include "utils.h"

const QString AvTransportClient::defaultServiceType =
    QStringLiteral("urn:schemas-upnp-org:service:AVTransport:1");

// argument names of each action, in the order they are sent
static const QHash<QString, QStringList> actionTemplates{
    {"SetAVTransportURI", {"CurrentURI", "CurrentURIMetaData"}},
    {"Play", {"Speed"}},
    {"Pause", {}},
    {"Stop", {}},
    {"Seek", {"Unit", "Target"}},
    {"GetTransportInfo", {}},
    {"GetPositionInfo", {}}};

static const QString envelopeTemplate = QStringLiteral(
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
    "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
    "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
    "<s:Body><u:%1 xmlns:u=\"%2\"><InstanceID>0</InstanceID>%3</u:%1>"
    "</s:Body></s:Envelope>");

static const QString didlTemplate = QStringLiteral(
    "<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\" "
    "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
    "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\" "
    "xmlns:sec=\"http://www.sec.co.kr/\">"
    "<item id=\"0\" parentID=\"-1\" restricted=\"1\">"
    "<dc:title>%1</dc:title>"
    "<upnp:class>%2</upnp:class>"
    "%3"
    "<res protocolInfo=\"http-get:*:%4:%5\">%6</res>"
    "%7"
    "</item></DIDL-Lite>");

QDebug operator<<(QDebug debug, TransportState state) {
    QDebugStateSaver saver{debug};
    switch (state) {
        case TransportState::Unknown:
            debug << "unknown";
            break;
        case TransportState::Stopped:
            debug << "stopped";
            break;
        case TransportState::Playing:
            debug << "playing";
            break;
        case TransportState::Transitioning:
            debug << "transitioning";
            break;
        case TransportState::PausedPlayback:
            debug << "paused-playback";
            break;
        case TransportState::NoMediaPresent:
            debug << "no-media-present";
            break;
    }
    return debug;
}

static inline QString localName(const QDomElement &elm) {
    return elm.tagName().section(':', -1);
}

// first element with given name without namespace prefix, depth-first
static QDomElement findElement(const QDomNode &parent, const QString &name) {
    for (auto child = parent.firstChildElement(); !child.isNull();
         child = child.nextSiblingElement()) {
        if (localName(child) == name) return child;
        if (auto elm = findElement(child, name); !elm.isNull()) return elm;
    }
    return {};
}

AvTransportClient::AvTransportClient(Options options,
                                     std::shared_ptr<Transport> transport)
    : m_options{options}, m_transport{std::move(transport)} {
    if (!m_transport) m_transport = std::make_shared<SoapHttpTransport>();
}

QByteArray AvTransportClient::makeEnvelope(const QString &action,
                                           const Params &params,
                                           const QString &serviceType) {
    auto it = actionTemplates.find(action);
    if (it == actionTemplates.end())
        throw ProtocolError{QStringLiteral("unsupported action: %1").arg(action)};

    QString args;
    for (const auto &name : it.value()) {
        auto pit = std::find_if(params.cbegin(), params.cend(),
                                [&name](const auto &p) { return p.first == name; });
        args.append(QStringLiteral("<%1>%2</%1>")
                        .arg(name, pit == params.cend()
                                       ? QString{}
                                       : pit->second.toHtmlEscaped()));
    }

    return envelopeTemplate.arg(action, serviceType, args).toUtf8();
}

QString AvTransportClient::makeDidl(const MediaInfo &media) {
    const auto mime =
        media.mime.isEmpty() ? Utils::mimeFromPath(media.url.path()) : media.mime;

    QString captions;
    QString subtitleRes;
    if (!media.subtitleUrl.isEmpty()) {
        const auto subUrl = media.subtitleUrl.toString().toHtmlEscaped();
        const auto subMime = media.subtitleMime.isEmpty()
                                 ? QStringLiteral("text/srt")
                                 : media.subtitleMime;
        const auto subType = subMime.section('/', -1);
        captions = QStringLiteral(
                       "<sec:CaptionInfo sec:type=\"%1\">%2</sec:CaptionInfo>"
                       "<sec:CaptionInfoEx sec:type=\"%1\">%2"
                       "</sec:CaptionInfoEx>")
                       .arg(subType, subUrl);
        subtitleRes =
            QStringLiteral("<res protocolInfo=\"http-get:*:%1:*\">%2</res>")
                .arg(subMime, subUrl);
    }

    return didlTemplate.arg(media.title.toHtmlEscaped(),
                            Utils::itemClassFromMime(mime), captions, mime,
                            Utils::dlnaContentFeatures(mime),
                            media.url.toString().toHtmlEscaped(), subtitleRes);
}

TransportState AvTransportClient::stateFromString(const QString &state) {
    if (state == QStringLiteral("PLAYING")) return TransportState::Playing;
    if (state == QStringLiteral("STOPPED")) return TransportState::Stopped;
    if (state == QStringLiteral("PAUSED_PLAYBACK"))
        return TransportState::PausedPlayback;
    if (state == QStringLiteral("NO_MEDIA_PRESENT"))
        return TransportState::NoMediaPresent;
    if (state == QStringLiteral("TRANSITIONING"))
        return TransportState::Transitioning;
    return TransportState::Unknown;
}

QDomElement AvTransportClient::parseResponse(
    const QString &action, const HttpClient::Response &response) {
    if (response.transportFailed()) {
        throw NetworkError{
            QStringLiteral("%1 failed: %2")
                .arg(action, response.timedOut ? QStringLiteral("timeout")
                                               : response.errorString)};
    }

    QDomDocument doc;
    QString errorMsg;
    int errorLine = 0;
    const bool parsed =
        doc.setContent(response.body, false, &errorMsg, &errorLine);

    if (parsed) {
        if (auto fault = findElement(doc, QStringLiteral("Fault"));
            !fault.isNull()) {
            const auto code =
                findElement(fault, QStringLiteral("errorCode")).text().toInt();
            auto desc = findElement(fault, QStringLiteral("errorDescription"))
                            .text();
            if (desc.isEmpty())
                desc = findElement(fault, QStringLiteral("faultstring")).text();
            throw ProtocolError{QStringLiteral("%1 fault: %2 %3")
                                    .arg(action)
                                    .arg(code)
                                    .arg(desc),
                                code};
        }
    }

    if (response.status != 200) {
        throw ProtocolError{
            QStringLiteral("%1 failed: http status %2").arg(action).arg(response.status)};
    }

    if (!parsed) {
        throw ProtocolError{QStringLiteral("%1 malformed response: %2 (line %3)")
                                .arg(action, errorMsg)
                                .arg(errorLine)};
    }

    auto elm = findElement(doc, action + QStringLiteral("Response"));
    if (elm.isNull()) {
        throw ProtocolError{
            QStringLiteral("%1 response element missing").arg(action)};
    }

    return elm;
}

// Returns false when interruption of the calling thread was requested.
static bool retrySleep(int msecs) {
    auto *thread = QThread::currentThread();

    QElapsedTimer timer;
    timer.start();

    while (!thread->isInterruptionRequested()) {
        const auto left = msecs - timer.elapsed();
        if (left <= 0) return true;
        QThread::msleep(
            static_cast<unsigned long>(std::min<qint64>(left, 50)));
    }

    return false;
}

QDomElement AvTransportClient::invoke(const QUrl &controlUrl,
                                      const QString &action,
                                      const Params &params,
                                      const QString &serviceType) {
    const auto body = makeEnvelope(action, params, serviceType);
    const auto soapAction =
        QStringLiteral("\"%1#%2\"").arg(serviceType, action).toUtf8();

    for (int attempt = 1;; ++attempt) {
        try {
            return parseResponse(action, m_transport->post(controlUrl, soapAction,
                                                           body,
                                                           m_options.timeout));
        } catch (const NetworkError &err) {
            if (attempt > m_options.retries ||
                QThread::currentThread()->isInterruptionRequested()) {
                qWarning() << "action failed:" << action << controlUrl
                           << err.what();
                throw;
            }
            qWarning() << "action failed, retrying:" << action << attempt
                       << err.what();
            if (!retrySleep(m_options.retryDelay * attempt)) {
                qDebug() << "retry cancelled:" << action;
                throw;
            }
        }
    }
}

void AvTransportClient::setTransportUri(const QUrl &controlUrl,
                                        const MediaInfo &media,
                                        const QString &serviceType) {
    qDebug() << "set av transport uri:" << controlUrl << media.url;
    invoke(controlUrl, QStringLiteral("SetAVTransportURI"),
           {{QStringLiteral("CurrentURI"), media.url.toString()},
            {QStringLiteral("CurrentURIMetaData"), makeDidl(media)}},
           serviceType);
}

void AvTransportClient::play(const QUrl &controlUrl,
                             const QString &serviceType) {
    invoke(controlUrl, QStringLiteral("Play"),
           {{QStringLiteral("Speed"), QStringLiteral("1")}}, serviceType);
}

void AvTransportClient::pause(const QUrl &controlUrl,
                              const QString &serviceType) {
    invoke(controlUrl, QStringLiteral("Pause"), {}, serviceType);
}

void AvTransportClient::stop(const QUrl &controlUrl,
                             const QString &serviceType) {
    invoke(controlUrl, QStringLiteral("Stop"), {}, serviceType);
}

void AvTransportClient::seek(const QUrl &controlUrl, int position,
                             const QString &serviceType) {
    invoke(controlUrl, QStringLiteral("Seek"),
           {{QStringLiteral("Unit"), QStringLiteral("REL_TIME")},
            {QStringLiteral("Target"), Utils::secToStr(position)}},
           serviceType);
}

AvTransportClient::TransportInfo AvTransportClient::getTransportInfo(
    const QUrl &controlUrl, const QString &serviceType) {
    auto elm =
        invoke(controlUrl, QStringLiteral("GetTransportInfo"), {}, serviceType);

    auto stateElm = findElement(elm, QStringLiteral("CurrentTransportState"));
    if (stateElm.isNull()) {
        throw ProtocolError{
            QStringLiteral("GetTransportInfo without CurrentTransportState")};
    }

    TransportInfo info;
    info.rawState = stateElm.text().trimmed();
    info.state = stateFromString(info.rawState);
    info.status =
        findElement(elm, QStringLiteral("CurrentTransportStatus")).text().trimmed();

    if (info.state == TransportState::Unknown)
        qWarning() << "unknown transport state:" << info.rawState;

    return info;
}

AvTransportClient::PositionInfo AvTransportClient::getPositionInfo(
    const QUrl &controlUrl, const QString &serviceType) {
    auto elm =
        invoke(controlUrl, QStringLiteral("GetPositionInfo"), {}, serviceType);

    PositionInfo info;
    info.trackDuration =
        Utils::strToSec(findElement(elm, QStringLiteral("TrackDuration")).text())
            .value_or(0);
    info.relTime =
        Utils::strToSec(findElement(elm, QStringLiteral("RelTime")).text())
            .value_or(0);
    info.trackUri = findElement(elm, QStringLiteral("TrackURI")).text();

    return info;
}

HttpClient::Response SoapHttpTransport::post(const QUrl &url,
                                             const QByteArray &soapAction,
                                             const QByteArray &body,
                                             int timeout) {
    return HttpClient::post(
        url, body,
        {{QByteArrayLiteral("Content-Type"),
          QByteArrayLiteral("text/xml; charset=\"utf-8\"")},
         {QByteArrayLiteral("SOAPACTION"), soapAction}},
        timeout);
}
