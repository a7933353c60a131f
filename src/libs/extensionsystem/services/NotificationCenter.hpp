// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/HostServices.hpp"

#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QObject>

namespace aics {

// Collects plugin notifications. Each one is logged, kept in a bounded
// history and announced through notificationPosted() for the UI to show.
class AICS_EXTENSIONSYSTEM_EXPORT NotificationCenter final : public QObject, public INotificationService
{
	Q_OBJECT

public:
	explicit NotificationCenter(int historyLimit = 200, QObject* parent = nullptr);

	void post(const QString& pluginId, const NotificationRequest& request) override;

	QList<Notification> history() const;
	void clearHistory();

signals:
	void notificationPosted(const aics::Notification& notification);

private:
	const int m_historyLimit;
	mutable QMutex m_mutex;
	QList<Notification> m_history;
};

} // namespace aics

Q_DECLARE_METATYPE(aics::Notification)
