// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginError.hpp"
#include "extensionsystem/PluginManifest.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QReadWriteLock>
#include <QtCore/QString>

#include <optional>

namespace aics {

// Parses manifests and keeps the set of manifests the host knows about,
// one per plugin id.
class AICS_EXTENSIONSYSTEM_EXPORT ManifestStore final
{
public:
	ManifestStore() = default;
	ManifestStore(const ManifestStore&) = delete;
	ManifestStore& operator=(const ManifestStore&) = delete;

	PluginError parse(const QByteArray& bytes, PluginManifest& out) const;

	// Reads manifest.json from `bundleDir`, parses it and checks that the
	// entry point names an existing file inside the bundle.
	PluginError loadFromBundle(const QString& bundleDir, PluginManifest& out) const;

	// Fails with ParseError when a manifest with the same id is known.
	PluginError add(const PluginManifest& manifest);
	bool remove(const QString& id);
	void clear();

	bool contains(const QString& id) const;
	std::optional<PluginManifest> manifest(const QString& id) const;
	QList<PluginManifest> manifests() const;
	int size() const;

private:
	mutable QReadWriteLock m_lock;
	QHash<QString, PluginManifest> m_manifests;
};

} // namespace aics
