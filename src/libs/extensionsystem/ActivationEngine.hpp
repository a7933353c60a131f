// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginError.hpp"
#include "extensionsystem/PluginInstance.hpp"
#include "extensionsystem/PluginTypes.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QReadWriteLock>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QThreadPool>
#include <QtCore/QVersionNumber>

#include <memory>

namespace Utils::Async {
class KeyedMutex;
}

namespace aics {

class HostApi;
class IInstanceLoader;
class InstallationManager;
class PluginHost;

// Drives installed plugins through Inactive -> Activating -> Active ->
// Deactivating -> Inactive and owns every live PluginInstance.
//
// Plugin hooks (initialize, cleanup, commands) run on a dedicated pool and
// are waited on for at most their timeout. A hook that overruns is abandoned:
// the plugin is treated as failed and the hook keeps its instance and host
// alive until it returns. Hooks of one instance never overlap; a cleanup
// queued behind an abandoned command starts once that command returns.
class AICS_EXTENSIONSYSTEM_EXPORT ActivationEngine final : public QObject
{
	Q_OBJECT

public:
	struct Settings {
		PluginContext context{QStringLiteral("1.0.0"), QStringLiteral("1.0.0"), RuntimeEnvironment::Development};
		int activationTimeoutMs = 10000;
		int cleanupTimeoutMs = 5000;
		int commandTimeoutMs = 30000;
	};

	ActivationEngine(const InstallationManager& installer,
	                 std::shared_ptr<IInstanceLoader> loader,
	                 std::shared_ptr<const HostApi> api,
	                 Utils::Async::KeyedMutex& idLocks,
	                 Settings settings,
	                 QObject* parent = nullptr);
	~ActivationEngine() override;

	// Activates `pluginId` after its dependencies. No-op when already active.
	PluginError activate(const QString& pluginId);

	// No-op unless active. Cleanup failures are logged, never returned.
	void deactivate(const QString& pluginId);

	// Deactivates everything, most recently activated first.
	void deactivateAll();

	// Empty result when the plugin is not active.
	PluginCommandResult executeCommand(const QString& pluginId, const PluginCommand& command);

	// Empty when the plugin is not active.
	QList<PluginUiContribution> uiContributions(const QString& pluginId);

	ActivationState state(const QString& pluginId) const;
	bool isActive(const QString& pluginId) const;
	QStringList activePluginIds() const; // activation order
	std::shared_ptr<PluginInstance> instance(const QString& pluginId) const;

	const QVersionNumber& hostVersion() const noexcept { return m_hostVersion; }

signals:
	void stateChanged(const QString& pluginId, aics::ActivationState state);
	void activated(const QString& pluginId);
	void deactivated(const QString& pluginId);
	void activationFailed(const QString& pluginId, const QString& message);

private:
	struct Entry {
		ActivationState state = ActivationState::Inactive;
		std::shared_ptr<PluginInstance> instance;
		std::shared_ptr<PluginHost> host;
		std::shared_ptr<QMutex> hookMutex; // held by whichever hook is inside the instance
	};

	PluginError resolveActivationOrder(const QString& pluginId, QStringList& order) const;
	PluginError activateOne(const QString& pluginId);
	void setState(const QString& pluginId, ActivationState state);
	bool activeEntry(const QString& pluginId, Entry& out) const;

	template <typename R, typename Fn>
	bool runHook(const QString& pluginId, const char* hook, int timeoutMs, std::shared_ptr<QMutex> hookMutex, Fn&& fn,
	             R& out, QString& failure);

	const InstallationManager& m_installer;
	std::shared_ptr<IInstanceLoader> m_loader;
	std::shared_ptr<const HostApi> m_api;
	Utils::Async::KeyedMutex& m_idLocks;
	const Settings m_settings;
	const QVersionNumber m_hostVersion;

	mutable QReadWriteLock m_lock;
	QHash<QString, Entry> m_entries; // non-Inactive plugins only
	QStringList m_activationOrder;

	std::unique_ptr<QThreadPool> m_hookPool;
};

} // namespace aics
