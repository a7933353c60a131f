// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/FileSystemUtils.hpp"

#include <QtCore/QDirIterator>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

#include <algorithm>

namespace Utils::FileSystemUtils {

QString uniqueChildName(const QDir& dir, const QString& baseName, const QString& ext)
{
    const QString trimmedBase = baseName.trimmed();
    if (trimmedBase.isEmpty())
        return {};

    QString normalizedExt = ext.trimmed();
    if (normalizedExt.startsWith(u'.'))
        normalizedExt.remove(0, 1);

    const QString suffix = normalizedExt.isEmpty() ? QString() : QStringLiteral(".%1").arg(normalizedExt);
    const QString candidate = trimmedBase + suffix;
    if (!dir.exists(candidate))
        return candidate;

    for (int i = 1; i < 1000; ++i) {
        const QString indexed = QStringLiteral("%1 (%2)%3").arg(trimmedBase).arg(i).arg(suffix);
        if (!dir.exists(indexed))
            return indexed;
    }

    return {};
}

QStringList relativeFilesRecursively(const QString& root)
{
    QStringList files;
    const QDir base(root);
    if (!base.exists())
        return files;

    QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        files.push_back(base.relativeFilePath(it.filePath()));
    }

    std::sort(files.begin(), files.end(), [](const QString& a, const QString& b) {
        return a.toUtf8() < b.toUtf8();
    });
    return files;
}

Result copyDirectoryRecursively(const QString& source,
                                const QString& destination,
                                const std::function<bool()>& shouldStop)
{
    const QFileInfo sourceInfo(source);
    if (!sourceInfo.isDir())
        return Result::failure(QStringLiteral("Source is not a directory: %1").arg(source));

    QDir dest;
    if (!dest.mkpath(destination))
        return Result::failure(QStringLiteral("Failed to create directory: %1").arg(destination));

    const QDir sourceDir(sourceInfo.absoluteFilePath());
    const QDir destDir(destination);

    QDirIterator it(sourceDir.absolutePath(),
                    QDir::Dirs | QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (shouldStop && shouldStop())
            return Result::failure(QStringLiteral("Copy of %1 was stopped.").arg(source));

        it.next();
        const QFileInfo info = it.fileInfo();
        const QString relative = sourceDir.relativeFilePath(info.absoluteFilePath());
        const QString target = destDir.absoluteFilePath(relative);

        if (info.isDir()) {
            if (!dest.mkpath(target))
                return Result::failure(QStringLiteral("Failed to create directory: %1").arg(target));
            continue;
        }

        if (!dest.mkpath(QFileInfo(target).absolutePath()))
            return Result::failure(QStringLiteral("Failed to create directory for: %1").arg(target));
        if (QFile::exists(target) && !QFile::remove(target))
            return Result::failure(QStringLiteral("Failed to replace file: %1").arg(target));

        QFile in(info.absoluteFilePath());
        if (!in.copy(target)) {
            return Result::failure(QStringLiteral("Failed to copy %1 to %2 (%3)")
                                       .arg(info.absoluteFilePath(), target, in.errorString()));
        }
    }

    return Result::success();
}

Result removeDirectoryRecursively(const QString& path)
{
    if (path.trimmed().isEmpty())
        return Result::failure(QStringLiteral("Refusing to remove an empty path."));

    QDir dir(path);
    if (!dir.exists())
        return Result::success();

    if (!dir.removeRecursively())
        return Result::failure(QStringLiteral("Failed to remove directory: %1").arg(path));
    return Result::success();
}

} // namespace Utils::FileSystemUtils
