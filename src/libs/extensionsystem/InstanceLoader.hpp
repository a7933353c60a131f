// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/Plugin.hpp"
#include "extensionsystem/PluginError.hpp"
#include "extensionsystem/PluginInstance.hpp"

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QString>

#include <functional>
#include <memory>

namespace aics {

// Turns an installed plugin into a fresh, uninitialized instance.
class AICS_EXTENSIONSYSTEM_EXPORT IInstanceLoader
{
public:
	virtual ~IInstanceLoader() = default;

	// Null with `error` set (LoadError) on failure.
	virtual std::shared_ptr<PluginInstance> load(const Plugin& plugin, PluginError& error) = 0;
};

// Loads the entry point as a shared library through QPluginLoader. Every
// instance holds its own loader; the library is released after the instance
// is destroyed.
class AICS_EXTENSIONSYSTEM_EXPORT LibraryInstanceLoader final : public IInstanceLoader
{
public:
	std::shared_ptr<PluginInstance> load(const Plugin& plugin, PluginError& error) override;
};

// Instances built by in-process factories, keyed by plugin id. Used for
// plugins compiled into the host and by tests.
class AICS_EXTENSIONSYSTEM_EXPORT FactoryInstanceLoader final : public IInstanceLoader
{
public:
	using Factory = std::function<std::unique_ptr<PluginInstance>()>;

	void registerFactory(const QString& pluginId, Factory factory);
	bool unregisterFactory(const QString& pluginId);
	bool hasFactory(const QString& pluginId) const;

	std::shared_ptr<PluginInstance> load(const Plugin& plugin, PluginError& error) override;

private:
	mutable QMutex m_mutex;
	QHash<QString, Factory> m_factories;
};

} // namespace aics
