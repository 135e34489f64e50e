/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef AVTRANSPORTCLIENT_H
#define AVTRANSPORTCLIENT_H

#include <QByteArray>
#include <QDebug>
#include <QDomElement>
#include <QString>
#include <QUrl>
#include <memory>
#include <utility>
#include <vector>

#include "httpclient.h"

enum class TransportState {
    Unknown,
    Stopped,
    Playing,
    Transitioning,
    PausedPlayback,
    NoMediaPresent
};

QDebug operator<<(QDebug debug, TransportState state);

/*
 * Client for the AVTransport service of a renderer.
 *
 * Every action is a SOAP call with bounded timeout. Network failures are
 * retried with linear backoff and end up as NetworkError. Faults and malformed
 * responses are reported at once as ProtocolError.
 */
class AvTransportClient {
   public:
    using param = std::pair<QString, QString>;
    using Params = std::vector<param>;

    static const QString defaultServiceType;

    struct Options {
        int timeout = 5000;     // 5s
        int retries = 2;
        int retryDelay = 500;   // 0.5s, multiplied by attempt
    };

    struct TransportInfo {
        TransportState state = TransportState::Unknown;
        QString rawState;
        QString status;
    };

    struct PositionInfo {
        int trackDuration = 0;
        int relTime = 0;
        QString trackUri;
    };

    struct MediaInfo {
        QUrl url;
        QString title;
        QString mime;
        QUrl subtitleUrl;
        QString subtitleMime;
    };

    class Transport {
       public:
        virtual ~Transport() = default;
        virtual HttpClient::Response post(const QUrl &url,
                                          const QByteArray &soapAction,
                                          const QByteArray &body,
                                          int timeout) = 0;
    };

    explicit AvTransportClient(Options options = {},
                               std::shared_ptr<Transport> transport = {});

    QDomElement invoke(const QUrl &controlUrl, const QString &action,
                       const Params &params = {},
                       const QString &serviceType = defaultServiceType);

    void setTransportUri(const QUrl &controlUrl, const MediaInfo &media,
                         const QString &serviceType = defaultServiceType);
    void play(const QUrl &controlUrl,
              const QString &serviceType = defaultServiceType);
    void pause(const QUrl &controlUrl,
               const QString &serviceType = defaultServiceType);
    void stop(const QUrl &controlUrl,
              const QString &serviceType = defaultServiceType);
    void seek(const QUrl &controlUrl, int position,
              const QString &serviceType = defaultServiceType);
    TransportInfo getTransportInfo(
        const QUrl &controlUrl,
        const QString &serviceType = defaultServiceType);
    PositionInfo getPositionInfo(
        const QUrl &controlUrl,
        const QString &serviceType = defaultServiceType);

    inline const Options &options() const { return m_options; }

    static QByteArray makeEnvelope(const QString &action, const Params &params,
                                   const QString &serviceType);
    static QString makeDidl(const MediaInfo &media);
    static TransportState stateFromString(const QString &state);
    static QDomElement parseResponse(const QString &action,
                                     const HttpClient::Response &response);

   private:
    Options m_options;
    std::shared_ptr<Transport> m_transport;
};

class SoapHttpTransport : public AvTransportClient::Transport {
   public:
    HttpClient::Response post(const QUrl &url, const QByteArray &soapAction,
                              const QByteArray &body, int timeout) override;
};

#endif  // AVTRANSPORTCLIENT_H
