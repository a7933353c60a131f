// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/HostServices.hpp"

#include <QtCore/QString>

namespace aics {

// Files below one workspace root. Paths may be relative to the root or
// absolute inside it; anything resolving outside is an InvalidRequest.
// Writes are atomic and create missing parent directories.
class AICS_EXTENSIONSYSTEM_EXPORT WorkspaceFileService final : public IFileService
{
public:
	explicit WorkspaceFileService(QString workspaceRoot);

	const QString& workspaceRoot() const noexcept { return m_root; }

	PluginError readFile(const QString& path, QByteArray& out) override;
	PluginError writeFile(const QString& path, const QByteArray& contents) override;

private:
	PluginError resolve(const QString& path, QString& out) const;

	QString m_root;
};

} // namespace aics
