// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/services/WorkspaceFileService.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>

namespace aics {

WorkspaceFileService::WorkspaceFileService(QString workspaceRoot)
    : m_root(workspaceRoot.isEmpty() ? QString() : QDir::cleanPath(QFileInfo(workspaceRoot).absoluteFilePath()))
{
}

PluginError WorkspaceFileService::resolve(const QString& path, QString& out) const
{
    if (m_root.isEmpty())
        return PluginError::unavailable(QStringLiteral("No workspace is open."));

    QString resolved;
    if (QDir::isAbsolutePath(path)) {
        const QString cleaned = QDir::cleanPath(path);
        if (Utils::PathUtils::isWithinRoot(m_root, cleaned))
            resolved = cleaned;
    } else {
        resolved = Utils::PathUtils::resolveWithinRoot(m_root, path);
    }

    if (resolved.isEmpty())
        return PluginError::invalidRequest(QStringLiteral("'%1' is outside the workspace.").arg(path));

    out = resolved;
    return PluginError::none();
}

PluginError WorkspaceFileService::readFile(const QString& path, QByteArray& out)
{
    QString resolved;
    if (PluginError err = resolve(path, resolved); !err.ok())
        return err;

    QFile file(resolved);
    if (!file.exists())
        return PluginError::notFound(QStringLiteral("No such file: %1").arg(path));
    if (!file.open(QIODevice::ReadOnly))
        return PluginError::commandFailed(QStringLiteral("Failed to read %1 (%2)").arg(path, file.errorString()));

    out = file.readAll();
    return PluginError::none();
}

PluginError WorkspaceFileService::writeFile(const QString& path, const QByteArray& contents)
{
    QString resolved;
    if (PluginError err = resolve(path, resolved); !err.ok())
        return err;

    if (!QDir().mkpath(QFileInfo(resolved).absolutePath()))
        return PluginError::commandFailed(QStringLiteral("Failed to create the directory for %1.").arg(path));

    QSaveFile file(resolved);
    if (!file.open(QIODevice::WriteOnly))
        return PluginError::commandFailed(QStringLiteral("Failed to open %1 (%2)").arg(path, file.errorString()));
    if (file.write(contents) != contents.size()) {
        file.cancelWriting();
        return PluginError::commandFailed(QStringLiteral("Failed to write %1 (%2)").arg(path, file.errorString()));
    }
    if (!file.commit())
        return PluginError::commandFailed(QStringLiteral("Failed to commit %1 (%2)").arg(path, file.errorString()));

    return PluginError::none();
}

} // namespace aics
