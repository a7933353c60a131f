// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/InstanceLoader.hpp"

#include "extensionsystem/PluginBundle.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QPluginLoader>

#include <exception>

namespace aics {

namespace {

// Factories are plugin code; anything they throw becomes a LoadError.
template <typename Fn>
std::unique_ptr<PluginInstance> createGuarded(const QString& pluginId, Fn&& create, PluginError& error)
{
    try {
        std::unique_ptr<PluginInstance> instance = create();
        if (!instance)
            error = PluginError::load(QStringLiteral("Plugin %1 did not create an instance.").arg(pluginId));
        return instance;
    } catch (const std::exception& e) {
        error = PluginError::load(QStringLiteral("Plugin %1 failed to create an instance: %2")
                                      .arg(pluginId, QString::fromLocal8Bit(e.what())));
    } catch (...) {
        error = PluginError::load(QStringLiteral("Plugin %1 raised a non-standard exception while creating "
                                                 "an instance.").arg(pluginId));
    }
    return {};
}

} // namespace

std::shared_ptr<PluginInstance> LibraryInstanceLoader::load(const Plugin& plugin, PluginError& error)
{
    error = PluginError::none();

    const QString entryPoint = PluginBundle::resolveEntryPoint(plugin.bundlePath, plugin.manifest);
    if (entryPoint.isEmpty() || !QFileInfo(entryPoint).isFile()) {
        error = PluginError::load(QStringLiteral("Entry point '%1' of %2 is missing.")
                                      .arg(plugin.manifest.entryPoint, plugin.id()));
        return {};
    }

    auto loader = std::make_shared<QPluginLoader>(entryPoint);
    QObject* root = loader->instance();
    if (!root) {
        error = PluginError::load(QStringLiteral("Failed to load %1: %2").arg(entryPoint, loader->errorString()));
        return {};
    }

    auto* factory = qobject_cast<IPluginFactory*>(root);
    if (!factory) {
        loader->unload();
        error = PluginError::load(QStringLiteral("%1 does not implement %2.")
                                      .arg(entryPoint, QLatin1StringView(AICS_PLUGIN_FACTORY_IID)));
        return {};
    }

    std::unique_ptr<PluginInstance> instance =
        createGuarded(plugin.id(), [factory] { return factory->createInstance(); }, error);
    if (!instance) {
        loader->unload();
        return {};
    }

    qCDebug(aicsExtensionSystemLog) << "Loaded" << plugin.id() << "from" << entryPoint;

    const QString pluginId = plugin.id();
    return std::shared_ptr<PluginInstance>(instance.release(), [loader, pluginId](PluginInstance* p) {
        delete p;
        if (!loader->unload())
            qCDebug(aicsExtensionSystemLog) << "Library of" << pluginId << "stays loaded:" << loader->errorString();
    });
}

void FactoryInstanceLoader::registerFactory(const QString& pluginId, Factory factory)
{
    QMutexLocker locker(&m_mutex);
    m_factories.insert(pluginId, std::move(factory));
}

bool FactoryInstanceLoader::unregisterFactory(const QString& pluginId)
{
    QMutexLocker locker(&m_mutex);
    return m_factories.remove(pluginId) > 0;
}

bool FactoryInstanceLoader::hasFactory(const QString& pluginId) const
{
    QMutexLocker locker(&m_mutex);
    return m_factories.contains(pluginId);
}

std::shared_ptr<PluginInstance> FactoryInstanceLoader::load(const Plugin& plugin, PluginError& error)
{
    error = PluginError::none();

    Factory factory;
    {
        QMutexLocker locker(&m_mutex);
        factory = m_factories.value(plugin.id());
    }
    if (!factory) {
        error = PluginError::load(QStringLiteral("No factory is registered for %1.").arg(plugin.id()));
        return {};
    }

    return createGuarded(plugin.id(), factory, error);
}

} // namespace aics
