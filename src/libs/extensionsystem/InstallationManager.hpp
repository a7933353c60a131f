// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/BundleVerifier.hpp"
#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/Plugin.hpp"
#include "extensionsystem/PluginError.hpp"

#include <utils/Result.hpp>

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QReadWriteLock>
#include <QtCore/QString>
#include <QtCore/QThreadPool>
#include <QtCore/QVersionNumber>

#include <functional>
#include <stop_token>

namespace Utils::Async {
class KeyedMutex;
}

namespace aics {

class ManifestStore;

struct InstallOptions {
	// Replace an installed plugin with the same id instead of failing.
	bool replaceExisting = false;
	// 0 uses the manager's default, negative waits forever.
	int timeoutMs = 0;
	// When set, a bundle declaring any other id is rejected.
	QString expectedId;
	std::stop_token stopToken;
};

// Owns the set of installed plugins and the managed plugins directory.
//
// Installed bundles live at <managed>/<id>.aicsplugin. Installs are staged in
// a temporary directory inside the managed directory and only moved into
// place once the bundle is fetched, parsed, compatible and verified; any
// failure leaves the installed set and the directory untouched.
class AICS_EXTENSIONSYSTEM_EXPORT InstallationManager final : public QObject
{
	Q_OBJECT

public:
	struct Settings {
		QString managedDirectory;
		QVersionNumber hostVersion;
		TrustPolicy trust;
		int installTimeoutMs = 120000;
	};

	// Called with the id lock held, before a plugin's bundle is removed or
	// replaced. The plugin manager uses it to deactivate the plugin.
	using BeforeRemoveHook = std::function<void(const QString& pluginId)>;
	using InstallCallback = std::function<void(const PluginError& error, const Plugin& plugin)>;

	InstallationManager(ManifestStore& store,
	                    Utils::Async::KeyedMutex& idLocks,
	                    Settings settings,
	                    QObject* parent = nullptr);
	~InstallationManager() override;

	const QString& managedDirectory() const noexcept { return m_settings.managedDirectory; }
	const QVersionNumber& hostVersion() const noexcept { return m_settings.hostVersion; }
	QString indexCachePath() const;

	void setBeforeRemoveHook(BeforeRemoveHook hook);

	// Rescans `directory` for bundles and replaces the installed set with what
	// it finds. Bundles with an unreadable manifest, a duplicate id or a too
	// new minimumAppVersion are skipped and logged. Plugins that drop out of
	// the set, or whose bundle moved, go through the before-remove hook first.
	// Runs exclusively of install() and uninstall().
	PluginList discover(const QString& directory);
	PluginList discover() { return discover(m_settings.managedDirectory); }

	PluginError install(const QString& source, const InstallOptions& options, Plugin& out);

	// Runs install() on the manager's pool; `done` is invoked on the thread of
	// `context`. Returns false if the work could not be queued.
	bool installAsync(const QString& source, InstallOptions options, QObject* context, InstallCallback done);

	PluginError uninstall(const QString& pluginId);

	PluginList installedPlugins() const;
	bool plugin(const QString& pluginId, Plugin& out) const;
	bool isInstalled(const QString& pluginId) const;

	// Restores the installed set from installed.json without scanning the
	// directory. Entries whose bundle is gone or no longer parses are dropped,
	// like discover() does.
	Utils::Result loadIndexCache();

	// Blocks until queued installAsync() work has finished.
	void waitForPendingInstalls();

signals:
	void pluginInstalled(const QString& pluginId);
	void pluginUninstalled(const QString& pluginId);
	void pluginsDiscovered(int count);

private:
	PluginError installLocked(const QString& bundleRoot, const PluginManifest& manifest,
	                          const InstallOptions& options, const QString& stagingDir, Plugin& out);
	void replaceInstalledSet(const PluginList& plugins);
	Utils::Result writeIndexCacheLocked() const;

	ManifestStore& m_store;
	Utils::Async::KeyedMutex& m_idLocks;
	const Settings m_settings;
	BeforeRemoveHook m_beforeRemove;

	// Shared by install() and uninstall(), exclusive for discover() and
	// loadIndexCache(). Always taken before any id lock.
	QReadWriteLock m_scanLock;

	mutable QReadWriteLock m_lock;
	QHash<QString, Plugin> m_installed;

	QThreadPool m_pool;
};

} // namespace aics
