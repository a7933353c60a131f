// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginManager.hpp"

#include "extensionsystem/InstanceLoader.hpp"

namespace aics {

namespace {

InstallationManager::Settings installSettings(const HostConfig& config)
{
    InstallationManager::Settings settings;
    settings.managedDirectory = config.pluginsDirectory;
    settings.hostVersion = config.hostVersionNumber();
    settings.trust = config.trust;
    settings.installTimeoutMs = config.installTimeoutMs;
    return settings;
}

ActivationEngine::Settings activationSettings(const HostConfig& config)
{
    ActivationEngine::Settings settings;
    settings.context = config.context();
    settings.activationTimeoutMs = config.activationTimeoutMs;
    settings.cleanupTimeoutMs = config.cleanupTimeoutMs;
    settings.commandTimeoutMs = config.commandTimeoutMs;
    return settings;
}

} // namespace

PluginManager::PluginManager(HostConfig config,
                             HostServices services,
                             std::shared_ptr<IInstanceLoader> loader,
                             QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_hostApi(std::make_shared<HostApi>(std::move(services)))
{
    if (!loader)
        loader = std::make_shared<LibraryInstanceLoader>();

    m_installer = std::make_unique<InstallationManager>(m_store, m_idLocks, installSettings(m_config));
    m_engine = std::make_unique<ActivationEngine>(*m_installer, std::move(loader), m_hostApi, m_idLocks,
                                                  activationSettings(m_config));

    m_installer->setBeforeRemoveHook([engine = m_engine.get()](const QString& pluginId) {
        engine->deactivate(pluginId);
    });

    qCInfo(aicsExtensionSystemLog) << "Plugin host" << m_config.hostVersion << "(API" << m_config.apiVersion << ")"
                                   << "managing" << m_config.pluginsDirectory;
}

PluginManager::~PluginManager()
{
    shutdown();
}

PluginList PluginManager::restore()
{
    if (const Utils::Result cached = m_installer->loadIndexCache(); cached)
        return m_installer->installedPlugins();

    return discover();
}

PluginList PluginManager::discover()
{
    return m_installer->discover();
}

Utils::Result PluginManager::loadCatalog()
{
    if (m_config.catalogPath.isEmpty())
        return Utils::Result::failure(QStringLiteral("No plugin catalog is configured."));
    return m_catalog.loadFile(m_config.catalogPath);
}

PluginError PluginManager::install(const QString& source, const InstallOptions& options, Plugin& out)
{
    return m_installer->install(source, options, out);
}

PluginError PluginManager::install(const QString& source, const InstallOptions& options)
{
    Plugin ignored;
    return m_installer->install(source, options, ignored);
}

bool PluginManager::installAsync(const QString& source, InstallOptions options, QObject* context,
                                 InstallationManager::InstallCallback done)
{
    return m_installer->installAsync(source, std::move(options), context, std::move(done));
}

PluginError PluginManager::installFromCatalog(const QString& pluginId, const InstallOptions& options, Plugin& out)
{
    const std::optional<CatalogEntry> entry = m_catalog.entry(pluginId);
    if (!entry)
        return PluginError::notFound(QStringLiteral("Plugin %1 is not in the catalog.").arg(pluginId));

    InstallOptions catalogOptions = options;
    catalogOptions.expectedId = pluginId;
    return m_installer->install(entry->source, catalogOptions, out);
}

PluginError PluginManager::uninstall(const QString& pluginId)
{
    return m_installer->uninstall(pluginId);
}

PluginError PluginManager::activate(const QString& pluginId)
{
    return m_engine->activate(pluginId);
}

void PluginManager::deactivate(const QString& pluginId)
{
    m_engine->deactivate(pluginId);
}

PluginCommandResult PluginManager::executeCommand(const QString& pluginId, const PluginCommand& command)
{
    return m_engine->executeCommand(pluginId, command);
}

QList<PluginUiContribution> PluginManager::uiContributions(const QString& pluginId)
{
    return m_engine->uiContributions(pluginId);
}

void PluginManager::shutdown()
{
    if (m_shutDown)
        return;
    m_shutDown = true;

    m_installer->waitForPendingInstalls();
    m_engine->deactivateAll();
    qCInfo(aicsExtensionSystemLog) << "Plugin host shut down";
}

} // namespace aics
