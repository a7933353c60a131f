// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ActivationEngine.hpp"
#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/HostApi.hpp"
#include "extensionsystem/HostConfig.hpp"
#include "extensionsystem/HostServices.hpp"
#include "extensionsystem/InstallationManager.hpp"
#include "extensionsystem/ManifestStore.hpp"
#include "extensionsystem/PluginCatalog.hpp"

#include <utils/Result.hpp>
#include <utils/async/KeyedMutex.hpp>

#include <QtCore/QObject>

#include <memory>

namespace aics {

class IInstanceLoader;

// The plugin host as one object: manifest store, installation manager,
// activation engine, host API and catalog, built from one HostConfig.
// Uninstalling or replacing a plugin deactivates it first. Destroying the
// manager deactivates every plugin.
class AICS_EXTENSIONSYSTEM_EXPORT PluginManager final : public QObject
{
	Q_OBJECT

public:
	// A null `loader` loads entry points as shared libraries.
	PluginManager(HostConfig config,
	              HostServices services,
	              std::shared_ptr<IInstanceLoader> loader = {},
	              QObject* parent = nullptr);
	~PluginManager() override;

	const HostConfig& config() const noexcept { return m_config; }

	ManifestStore& manifestStore() noexcept { return m_store; }
	InstallationManager& installer() noexcept { return *m_installer; }
	const InstallationManager& installer() const noexcept { return *m_installer; }
	ActivationEngine& engine() noexcept { return *m_engine; }
	const ActivationEngine& engine() const noexcept { return *m_engine; }
	const HostApi& hostApi() const noexcept { return *m_hostApi; }
	PluginCatalog& catalog() noexcept { return m_catalog; }

	// Restores the installed set from the index cache, falling back to a
	// directory scan when the cache is missing or unreadable.
	PluginList restore();
	PluginList discover();

	// Loads the catalog named by the configuration, if any.
	Utils::Result loadCatalog();

	PluginError install(const QString& source, const InstallOptions& options, Plugin& out);
	PluginError install(const QString& source, const InstallOptions& options = {});
	bool installAsync(const QString& source, InstallOptions options, QObject* context,
	                  InstallationManager::InstallCallback done);
	PluginError installFromCatalog(const QString& pluginId, const InstallOptions& options, Plugin& out);
	PluginError uninstall(const QString& pluginId);

	PluginError activate(const QString& pluginId);
	void deactivate(const QString& pluginId);
	PluginCommandResult executeCommand(const QString& pluginId, const PluginCommand& command);
	QList<PluginUiContribution> uiContributions(const QString& pluginId);

	// Deactivates every plugin and waits for queued installs. Idempotent.
	void shutdown();

private:
	const HostConfig m_config;
	Utils::Async::KeyedMutex m_idLocks;
	ManifestStore m_store;
	PluginCatalog m_catalog;
	std::shared_ptr<const HostApi> m_hostApi;
	std::unique_ptr<InstallationManager> m_installer;
	std::unique_ptr<ActivationEngine> m_engine;
	bool m_shutDown = false;
};

} // namespace aics
