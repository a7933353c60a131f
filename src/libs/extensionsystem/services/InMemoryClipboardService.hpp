// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/HostServices.hpp"

#include <QtCore/QMutex>
#include <QtCore/QString>

namespace aics {

// Clipboard for headless hosts; GUI embedders supply one backed by the system
// clipboard.
class AICS_EXTENSIONSYSTEM_EXPORT InMemoryClipboardService final : public IClipboardService
{
public:
	QString text() const override;
	void setText(const QString& text) override;

private:
	mutable QMutex m_mutex;
	QString m_text;
};

} // namespace aics
