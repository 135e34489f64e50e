/* Copyright (C) 2021-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "httpclient.h"

#include <QDebug>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QThread>
#include <QTimer>
#include <memory>

#include "config.h"

static const QByteArray userAgent =
    QByteArrayLiteral(APP_ID "/" APP_VERSION " UPnP/1.0 DLNADOC/1.50");

static void setRequestProps(QNetworkRequest &request,
                            const HttpClient::Headers &headers) {
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader(QByteArrayLiteral("Connection"),
                         QByteArrayLiteral("close"));
    request.setRawHeader(QByteArrayLiteral("User-Agent"), userAgent);
    for (const auto &header : headers)
        request.setRawHeader(header.first, header.second);
}

QByteArray HttpClient::Response::header(const QByteArray &name) const {
    const auto lname = name.toLower();
    for (const auto &h : headers) {
        if (h.first.toLower() == lname) return h.second;
    }
    return {};
}

HttpClient::Response HttpClient::get(const QUrl &url, const Headers &headers,
                                     int timeout) {
    return send(Method::Get, url, {}, headers, timeout);
}

HttpClient::Response HttpClient::post(const QUrl &url, const QByteArray &body,
                                      const Headers &headers, int timeout) {
    return send(Method::Post, url, body, headers, timeout);
}

HttpClient::Response HttpClient::send(Method method, const QUrl &url,
                                      const QByteArray &body,
                                      const Headers &headers, int timeout) {
    Response response;

    if (!url.isValid() || url.host().isEmpty()) {
        qWarning() << "invalid url:" << url;
        response.error = QNetworkReply::ProtocolInvalidOperationError;
        response.errorString = QStringLiteral("invalid url");
        return response;
    }

    auto *thread = QThread::currentThread();
    if (thread->isInterruptionRequested()) {
        response.interrupted = true;
        response.error = QNetworkReply::OperationCanceledError;
        response.errorString = QStringLiteral("interrupted");
        return response;
    }

    QNetworkRequest request{url};
    setRequestProps(request, headers);

    // reply is owned by the manager
    auto nam = std::make_unique<QNetworkAccessManager>();
    auto *reply = method == Method::Post ? nam->post(request, body)
                                         : nam->get(request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    timer.setInterval(timeout);

    QObject::connect(&timer, &QTimer::timeout, &loop, [&response, reply] {
        qWarning() << "timeout => aborting:" << reply->url();
        response.timedOut = true;
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer interruptTimer;
    interruptTimer.setInterval(interruptCheckInterval);
    QObject::connect(&interruptTimer, &QTimer::timeout, &loop,
                     [&response, reply, thread] {
                         if (!thread->isInterruptionRequested() ||
                             reply->isFinished())
                             return;
                         qDebug() << "thread interrupted => aborting:"
                                  << reply->url();
                         response.interrupted = true;
                         reply->abort();
                     });

    timer.start();
    interruptTimer.start();
    if (!reply->isFinished()) loop.exec();
    interruptTimer.stop();
    timer.stop();

    response.status =
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.error = reply->error();
    response.headers = reply->rawHeaderPairs();
    response.body = reply->readAll();

    if (response.error != QNetworkReply::NoError) {
        response.errorString = reply->errorString();
#ifdef QT_DEBUG
        qDebug() << "http error:" << url << response.status << response.error;
#endif
    }

    return response;
}
