// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>

namespace Utils::PathUtils {

namespace {

constexpr int kMaxLinkHops = 32;

// Canonical form of the deepest existing ancestor with the remaining segments
// appended. Dangling symlinks are followed to their target. Empty on a link
// loop or an unreadable link.
QString comparablePath(const QString& path)
{
    QString current = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    QStringList tail;
    int hops = 0;

    while (true) {
        const QFileInfo info(current);
        const QString canonical = info.canonicalFilePath();
        if (!canonical.isEmpty())
            return tail.isEmpty() ? canonical : QDir::cleanPath(QDir(canonical).filePath(tail.join(u'/')));

        if (info.isSymLink()) {
            const QString target = info.symLinkTarget();
            if (target.isEmpty() || ++hops > kMaxLinkHops)
                return {};
            current = QDir::cleanPath(target);
            continue;
        }

        const qsizetype slash = current.lastIndexOf(u'/');
        if (slash < 0)
            return QDir::cleanPath(path);
        QString parent = current.left(slash);
        if (parent.isEmpty() || parent.endsWith(u':'))
            parent += u'/';
        if (parent == current)
            return current;

        tail.prepend(current.mid(slash + 1));
        current = parent;
    }
}

} // namespace

QString normalizePath(QStringView path)
{
    const QString s = QDir::fromNativeSeparators(path.toString()).trimmed();
    QString cleaned = QDir::cleanPath(s);
    if (cleaned == QLatin1String("."))
        cleaned.clear();
    return cleaned;
}

QString basename(QStringView path)
{
    const QString cleaned = normalizePath(path);
    if (cleaned.isEmpty())
        return {};

    const qsizetype slash = cleaned.lastIndexOf(u'/');
    if (slash < 0)
        return cleaned;
    return cleaned.mid(slash + 1);
}

QString extension(QStringView path)
{
    const QString name = basename(path);
    const qsizetype dot = name.lastIndexOf(u'.');
    if (dot <= 0)
        return {};
    return name.mid(dot + 1);
}

bool hasExtension(QStringView path, QStringView ext, Qt::CaseSensitivity cs)
{
    QString wanted = ext.toString();
    if (wanted.startsWith(u'.'))
        wanted.remove(0, 1);
    return QString::compare(extension(path), wanted, cs) == 0;
}

bool isContainedRelativePath(QStringView relativePath)
{
    const QString cleaned = normalizePath(relativePath);
    if (cleaned.isEmpty())
        return false;
    if (QDir::isAbsolutePath(cleaned))
        return false;
    if (cleaned == QLatin1String("..") || cleaned.startsWith(QLatin1String("../")))
        return false;
    return true;
}

bool isWithinRoot(const QString& root, const QString& path)
{
    if (root.trimmed().isEmpty() || path.trimmed().isEmpty())
        return false;

    const QString base = comparablePath(root);
    const QString candidate = comparablePath(path);
    if (base.isEmpty() || candidate.isEmpty())
        return false;
    if (candidate == base)
        return true;

    const QString prefix = base.endsWith(u'/') ? base : base + u'/';
    return candidate.startsWith(prefix);
}

QString resolveWithinRoot(const QString& root, const QString& relativePath)
{
    if (!isContainedRelativePath(relativePath))
        return {};

    const QString resolved = QDir::cleanPath(QDir(root).absoluteFilePath(normalizePath(relativePath)));
    if (!isWithinRoot(root, resolved))
        return {};
    return resolved;
}

} // namespace Utils::PathUtils
