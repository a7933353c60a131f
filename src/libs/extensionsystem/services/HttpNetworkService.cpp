// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/services/HttpNetworkService.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QVariant>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <memory>

namespace aics {

PluginError HttpNetworkService::send(const NetworkRequest& request, HttpReply& out)
{
    QNetworkAccessManager network;

    QNetworkRequest httpRequest(request.url);
    httpRequest.setTransferTimeout(request.timeoutMs);
    httpRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                             QNetworkRequest::NoLessSafeRedirectPolicy);
    for (auto it = request.headers.cbegin(); it != request.headers.cend(); ++it)
        httpRequest.setRawHeader(it.key(), it.value());

    const QByteArray method = request.method.toUpper();
    QNetworkReply* rawReply = nullptr;
    if (method == "GET")
        rawReply = network.get(httpRequest);
    else if (method == "HEAD")
        rawReply = network.head(httpRequest);
    else
        rawReply = network.sendCustomRequest(httpRequest, method, request.body);

    const std::unique_ptr<QNetworkReply> reply(rawReply);
    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid()) {
        return PluginError::commandFailed(QStringLiteral("%1 %2 failed: %3")
                                              .arg(QString::fromLatin1(method), request.url.toString(),
                                                   reply->errorString()));
    }

    out.statusCode = status.toInt();
    out.headers.clear();
    for (const auto& [name, value] : reply->rawHeaderPairs())
        out.headers.insert(name, value);
    out.body = reply->readAll();
    return PluginError::none();
}

} // namespace aics
