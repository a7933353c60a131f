// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/ManifestStore.hpp"

#include "extensionsystem/PluginBundle.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QReadLocker>
#include <QtCore/QWriteLocker>

#include <algorithm>

namespace aics {

PluginError ManifestStore::parse(const QByteArray& bytes, PluginManifest& out) const
{
    return PluginManifest::parse(bytes, out);
}

PluginError ManifestStore::loadFromBundle(const QString& bundleDir, PluginManifest& out) const
{
    QByteArray bytes;
    QString readError;
    if (!PluginBundle::readManifestBytes(bundleDir, bytes, &readError))
        return PluginError::parse(readError);

    PluginManifest parsed;
    if (auto err = parse(bytes, parsed); !err.ok())
        return PluginError::parse(QStringLiteral("%1: %2").arg(PluginBundle::manifestPath(bundleDir), err.message()));

    const QString entry = PluginBundle::resolveEntryPoint(bundleDir, parsed);
    if (entry.isEmpty()) {
        return PluginError::parse(QStringLiteral("Entry point '%1' of plugin %2 escapes its bundle.")
                                      .arg(parsed.entryPoint, parsed.id));
    }
    if (!QFileInfo(entry).isFile()) {
        return PluginError::parse(QStringLiteral("Entry point '%1' of plugin %2 does not exist in %3.")
                                      .arg(parsed.entryPoint, parsed.id, bundleDir));
    }

    out = std::move(parsed);
    return PluginError::none();
}

PluginError ManifestStore::add(const PluginManifest& manifest)
{
    if (!PluginManifest::isValidId(manifest.id))
        return PluginError::parse(QStringLiteral("Invalid plugin id '%1'.").arg(manifest.id));

    QWriteLocker locker(&m_lock);
    if (m_manifests.contains(manifest.id))
        return PluginError::parse(QStringLiteral("Duplicate plugin id '%1'.").arg(manifest.id));

    m_manifests.insert(manifest.id, manifest);
    return PluginError::none();
}

bool ManifestStore::remove(const QString& id)
{
    QWriteLocker locker(&m_lock);
    return m_manifests.remove(id) > 0;
}

void ManifestStore::clear()
{
    QWriteLocker locker(&m_lock);
    m_manifests.clear();
}

bool ManifestStore::contains(const QString& id) const
{
    QReadLocker locker(&m_lock);
    return m_manifests.contains(id);
}

std::optional<PluginManifest> ManifestStore::manifest(const QString& id) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_manifests.constFind(id);
    if (it == m_manifests.cend())
        return std::nullopt;
    return it.value();
}

QList<PluginManifest> ManifestStore::manifests() const
{
    QList<PluginManifest> out;
    {
        QReadLocker locker(&m_lock);
        out = m_manifests.values();
    }
    std::sort(out.begin(), out.end(), [](const PluginManifest& a, const PluginManifest& b) {
        return a.id < b.id;
    });
    return out;
}

int ManifestStore::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_manifests.size());
}

} // namespace aics
