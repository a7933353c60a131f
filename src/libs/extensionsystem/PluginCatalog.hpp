// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginManifest.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QReadWriteLock>
#include <QtCore/QString>

#include <optional>

namespace aics {

enum class PluginCategory : quint8 {
	All,
	Languages,
	Themes,
	Tools,
	Ai,
	Ui
};

AICS_EXTENSIONSYSTEM_EXPORT QString toString(PluginCategory category);
AICS_EXTENSIONSYSTEM_EXPORT std::optional<PluginCategory> categoryFromString(QStringView text);

// Capability a category filters on. All maps to Commands but does not filter.
AICS_EXTENSIONSYSTEM_EXPORT PluginCapability capabilityFor(PluginCategory category);

struct CatalogEntry {
	PluginManifest manifest;
	QString source; // anything InstallationManager::install() accepts
};

// Plugins available for installation, read from a catalog file:
//
//   { "plugins": [ { "manifest": { ... }, "source": "bundles/fmt.zip" }, ... ] }
//
// Relative local sources are resolved against the catalog file's directory.
// Entries with an invalid manifest, no source or a repeated id are skipped.
class AICS_EXTENSIONSYSTEM_EXPORT PluginCatalog final
{
public:
	PluginCatalog() = default;
	PluginCatalog(const PluginCatalog&) = delete;
	PluginCatalog& operator=(const PluginCatalog&) = delete;

	Utils::Result loadFile(const QString& path);
	Utils::Result load(const QJsonObject& root, const QString& baseDirectory = {});
	void clear();

	QList<CatalogEntry> entries() const;
	std::optional<CatalogEntry> entry(const QString& pluginId) const;
	int size() const;

	// Category first, then a case-insensitive match of `query` against name
	// or description. An empty query matches everything.
	QList<CatalogEntry> search(const QString& query, PluginCategory category = PluginCategory::All) const;

private:
	mutable QReadWriteLock m_lock;
	QList<CatalogEntry> m_entries;
};

} // namespace aics
