// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/services/NotificationCenter.hpp"

#include <QtCore/QMutexLocker>

namespace aics {

NotificationCenter::NotificationCenter(int historyLimit, QObject* parent)
    : QObject(parent)
    , m_historyLimit(qMax(1, historyLimit))
{
    qRegisterMetaType<aics::Notification>();
}

void NotificationCenter::post(const QString& pluginId, const NotificationRequest& request)
{
    Notification notification{pluginId, request.title, request.message, request.level,
                              QDateTime::currentDateTimeUtc()};

    switch (request.level) {
    case NotificationLevel::Info:
        qCInfo(aicsHostApiLog).noquote() << QStringLiteral("[%1] %2: %3").arg(pluginId, request.title, request.message);
        break;
    case NotificationLevel::Success:
        qCInfo(aicsHostApiLog).noquote() << QStringLiteral("[%1] %2 %3: %4")
                                                .arg(pluginId, toString(request.level), request.title,
                                                     request.message);
        break;
    case NotificationLevel::Warning:
    case NotificationLevel::Error:
        qCWarning(aicsHostApiLog).noquote() << QStringLiteral("[%1] %2 %3: %4")
                                                   .arg(pluginId, toString(request.level), request.title,
                                                        request.message);
        break;
    }

    {
        QMutexLocker locker(&m_mutex);
        m_history.push_back(notification);
        while (m_history.size() > m_historyLimit)
            m_history.removeFirst();
    }

    emit notificationPosted(notification);
}

QList<Notification> NotificationCenter::history() const
{
    QMutexLocker locker(&m_mutex);
    return m_history;
}

void NotificationCenter::clearHistory()
{
    QMutexLocker locker(&m_mutex);
    m_history.clear();
}

} // namespace aics
