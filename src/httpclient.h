/* Copyright (C) 2021-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <QByteArray>
#include <QList>
#include <QNetworkReply>
#include <QPair>
#include <QString>
#include <QUrl>

/*
 * Blocking HTTP client. Every call runs its own event loop, so it can be used
 * from any thread, including pool workers and monitor threads.
 *
 * A request is aborted when interruption of the calling QThread is
 * requested.
 */
class HttpClient {
   public:
    using Headers = QList<QPair<QByteArray, QByteArray>>;

    struct Response {
        int status = 0;
        QByteArray body;
        Headers headers;
        QNetworkReply::NetworkError error = QNetworkReply::NoError;
        QString errorString;
        bool timedOut = false;
        bool interrupted = false;

        // no HTTP response was received at all
        inline bool transportFailed() const {
            return timedOut || interrupted || status == 0;
        }
        // case-insensitive, empty when missing
        QByteArray header(const QByteArray &name) const;
    };

    static const int httpTimeout = 5000;  // 5s
    static const int interruptCheckInterval = 50;

    static Response get(const QUrl &url, const Headers &headers = {},
                        int timeout = httpTimeout);
    static Response post(const QUrl &url, const QByteArray &body,
                         const Headers &headers = {},
                         int timeout = httpTimeout);

   private:
    enum class Method { Get, Post };
    static Response send(Method method, const QUrl &url,
                         const QByteArray &body, const Headers &headers,
                         int timeout);
};

#endif  // HTTPCLIENT_H
