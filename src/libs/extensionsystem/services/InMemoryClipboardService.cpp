// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/services/InMemoryClipboardService.hpp"

#include <QtCore/QMutexLocker>

namespace aics {

QString InMemoryClipboardService::text() const
{
    QMutexLocker locker(&m_mutex);
    return m_text;
}

void InMemoryClipboardService::setText(const QString& text)
{
    QMutexLocker locker(&m_mutex);
    m_text = text;
}

} // namespace aics
