// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/InstallationManager.hpp"

#include "extensionsystem/BundleFetcher.hpp"
#include "extensionsystem/ManifestStore.hpp"
#include "extensionsystem/PluginBundle.hpp"

#include <utils/async/AsyncTask.hpp>
#include <utils/async/KeyedMutex.hpp>
#include <utils/filesystem/FileSystemUtils.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDeadlineTimer>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QReadLocker>
#include <QtCore/QSet>
#include <QtCore/QStringList>
#include <QtCore/QTemporaryDir>
#include <QtCore/QWriteLocker>

#include <algorithm>
#include <utility>
#include <vector>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

const QString kIndexCacheFile = u"installed.json"_s;
const QString kStagingTemplate = u".staging-XXXXXX"_s;
const QString kPluginsKey = u"plugins"_s;
const QString kIdKey = u"id"_s;
const QString kBundlePathKey = u"bundlePath"_s;
const QString kFormatKey = u"format"_s;
constexpr int kIndexCacheFormat = 1;

struct InstallOutcome {
    PluginError error;
    Plugin plugin;
};

PluginList sortedById(PluginList plugins)
{
    std::sort(plugins.begin(), plugins.end(), [](const Plugin& a, const Plugin& b) { return a.id() < b.id(); });
    return plugins;
}

QDeadlineTimer deadlineFor(int timeoutMs)
{
    if (timeoutMs < 0)
        return QDeadlineTimer(QDeadlineTimer::Forever);
    return QDeadlineTimer(timeoutMs);
}

} // namespace

InstallationManager::InstallationManager(ManifestStore& store,
                                         Utils::Async::KeyedMutex& idLocks,
                                         Settings settings,
                                         QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_idLocks(idLocks)
    , m_settings(std::move(settings))
{
    m_pool.setObjectName(u"aics-install"_s);
}

InstallationManager::~InstallationManager()
{
    m_pool.waitForDone();
}

QString InstallationManager::indexCachePath() const
{
    return QDir(m_settings.managedDirectory).filePath(kIndexCacheFile);
}

void InstallationManager::setBeforeRemoveHook(BeforeRemoveHook hook)
{
    QWriteLocker locker(&m_lock);
    m_beforeRemove = std::move(hook);
}

PluginList InstallationManager::discover(const QString& directory)
{
    QWriteLocker scanLocker(&m_scanLock);

    PluginList found;
    QHash<QString, QString> seen; // id -> bundle path

    const QDir dir(directory);
    if (!dir.exists()) {
        qCInfo(aicsExtensionSystemLog) << "Plugin directory" << directory << "does not exist";
    } else {
        const QFileInfoList entries =
            dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
        for (const QFileInfo& entry : entries) {
            if (!PluginBundle::hasBundleExtension(entry.fileName()))
                continue;

            const QString bundlePath = entry.absoluteFilePath();
            PluginManifest manifest;
            if (const PluginError err = m_store.loadFromBundle(bundlePath, manifest); !err.ok()) {
                qCWarning(aicsExtensionSystemLog).noquote() << "Skipping bundle" << bundlePath << "-" << err.toString();
                continue;
            }
            if (const auto it = seen.constFind(manifest.id); it != seen.cend()) {
                qCWarning(aicsExtensionSystemLog) << "Skipping bundle" << bundlePath << "- plugin" << manifest.id
                                                  << "is already provided by" << it.value();
                continue;
            }
            if (manifest.requiresNewerHost(m_settings.hostVersion)) {
                qCWarning(aicsExtensionSystemLog) << "Skipping bundle" << bundlePath << "- plugin" << manifest.id
                                                  << "requires host" << manifest.minimumAppVersion;
                continue;
            }

            seen.insert(manifest.id, bundlePath);
            found.push_back(Plugin{std::move(manifest), bundlePath});
        }
    }

    replaceInstalledSet(found);
    qCInfo(aicsExtensionSystemLog) << "Discovered" << found.size() << "plugin(s) in" << directory;
    emit pluginsDiscovered(int(found.size()));
    return sortedById(found);
}

void InstallationManager::replaceInstalledSet(const PluginList& plugins)
{
    QHash<QString, QString> nextBundles; // id -> bundle path
    for (const Plugin& plugin : plugins)
        nextBundles.insert(plugin.id(), QDir::cleanPath(plugin.bundlePath));

    QStringList dropped;
    BeforeRemoveHook hook;
    {
        QReadLocker locker(&m_lock);
        for (auto it = m_installed.cbegin(); it != m_installed.cend(); ++it) {
            const auto next = nextBundles.constFind(it.key());
            if (next == nextBundles.cend() || next.value() != QDir::cleanPath(it->bundlePath))
                dropped.push_back(it.key());
        }
        hook = m_beforeRemove;
    }

    // Held until the new set is in place so a dropped plugin cannot be
    // reactivated from its old record.
    std::vector<Utils::Async::KeyedMutex::Locker> droppedLocks;
    droppedLocks.reserve(size_t(dropped.size()));
    for (const QString& id : std::as_const(dropped)) {
        droppedLocks.push_back(m_idLocks.lock(id));
        qCInfo(aicsExtensionSystemLog) << "Plugin" << id << "is no longer installed at its recorded bundle";
        if (hook)
            hook(id);
    }

    QWriteLocker locker(&m_lock);
    m_installed.clear();
    m_store.clear();
    for (const Plugin& plugin : plugins) {
        m_installed.insert(plugin.id(), plugin);
        if (const PluginError err = m_store.add(plugin.manifest); !err.ok())
            qCWarning(aicsExtensionSystemLog).noquote() << err.toString();
    }

    if (const Utils::Result written = writeIndexCacheLocked(); !written)
        qCWarning(aicsExtensionSystemLog).noquote() << "Failed to write plugin index:" << written.errorString();
}

PluginError InstallationManager::install(const QString& source, const InstallOptions& options, Plugin& out)
{
    const QDeadlineTimer deadline = deadlineFor(options.timeoutMs == 0 ? m_settings.installTimeoutMs
                                                                       : options.timeoutMs);

    if (!QDir().mkpath(m_settings.managedDirectory)) {
        return PluginError::install(QStringLiteral("Failed to create plugins directory %1.")
                                        .arg(m_settings.managedDirectory));
    }

    // Removed with everything in it on every exit path.
    QTemporaryDir staging(QDir(m_settings.managedDirectory).filePath(kStagingTemplate));
    if (!staging.isValid())
        return PluginError::install(QStringLiteral("Failed to create staging directory: %1").arg(staging.errorString()));

    QString bundleRoot;
    if (PluginError err = BundleFetcher::fetch(source, staging.path(), deadline, options.stopToken, bundleRoot);
        !err.ok()) {
        return err;
    }

    PluginManifest manifest;
    if (const PluginError err = m_store.loadFromBundle(bundleRoot, manifest); !err.ok())
        return PluginError::install(QStringLiteral("Invalid plugin bundle: %1").arg(err.message()));

    if (!options.expectedId.isEmpty() && manifest.id != options.expectedId) {
        return PluginError::install(QStringLiteral("Bundle from %1 contains plugin %2, expected %3.")
                                        .arg(source, manifest.id, options.expectedId));
    }

    if (manifest.requiresNewerHost(m_settings.hostVersion)) {
        return PluginError::incompatible(QStringLiteral("Plugin %1 requires host version %2 (running %3).")
                                             .arg(manifest.id, manifest.minimumAppVersion,
                                                  m_settings.hostVersion.toString()));
    }

    if (PluginError err = BundleVerifier::verify(bundleRoot, m_settings.trust); !err.ok())
        return err;

    if (options.stopToken.stop_requested())
        return PluginError::install(QStringLiteral("Installation of %1 was cancelled.").arg(manifest.id));
    if (deadline.hasExpired())
        return PluginError::install(QStringLiteral("Installation of %1 timed out.").arg(manifest.id));

    QReadLocker scanLocker(&m_scanLock);
    const auto idLock = m_idLocks.lock(manifest.id);
    return installLocked(bundleRoot, manifest, options, staging.path(), out);
}

PluginError InstallationManager::installLocked(const QString& bundleRoot,
                                               const PluginManifest& manifest,
                                               const InstallOptions& options,
                                               const QString& stagingDir,
                                               Plugin& out)
{
    const QDir managed(m_settings.managedDirectory);
    const QString target = managed.absoluteFilePath(PluginBundle::bundleDirectoryName(manifest.id));

    Plugin previous;
    const bool replacing = plugin(manifest.id, previous);
    if (replacing && !options.replaceExisting)
        return PluginError::install(QStringLiteral("Plugin %1 is already installed.").arg(manifest.id));

    // The old bundle is parked in staging until the new one is in place.
    QString parked;
    if (replacing) {
        BeforeRemoveHook hook;
        {
            QReadLocker locker(&m_lock);
            hook = m_beforeRemove;
        }
        if (hook)
            hook(manifest.id);

        parked = QDir(stagingDir).filePath(u"previous"_s);
        if (!QDir().rename(previous.bundlePath, parked)) {
            return PluginError::install(QStringLiteral("Failed to move aside the installed bundle %1.")
                                            .arg(previous.bundlePath));
        }
    }

    if (QFileInfo::exists(target)) {
        qCWarning(aicsExtensionSystemLog) << "Removing unregistered bundle at" << target;
        if (const Utils::Result removed = Utils::FileSystemUtils::removeDirectoryRecursively(target); !removed)
            return PluginError::install(removed.errorString());
    }

    if (!QDir().rename(bundleRoot, target)) {
        if (!parked.isEmpty() && !QDir().rename(parked, previous.bundlePath))
            qCCritical(aicsExtensionSystemLog) << "Failed to restore bundle" << previous.bundlePath;
        return PluginError::install(QStringLiteral("Failed to move bundle into %1.").arg(target));
    }

    Plugin installed{manifest, target};
    {
        QWriteLocker locker(&m_lock);
        if (replacing) {
            m_installed.remove(previous.id());
            m_store.remove(previous.id());
        }
        m_installed.insert(installed.id(), installed);
        if (const PluginError err = m_store.add(installed.manifest); !err.ok())
            qCWarning(aicsExtensionSystemLog).noquote() << err.toString();
        if (const Utils::Result written = writeIndexCacheLocked(); !written)
            qCWarning(aicsExtensionSystemLog).noquote() << "Failed to write plugin index:" << written.errorString();
    }

    qCInfo(aicsExtensionSystemLog) << (replacing ? "Replaced" : "Installed") << installed.id()
                                   << installed.manifest.version << "at" << target;
    out = installed;
    emit pluginInstalled(installed.id());
    return PluginError::none();
}

bool InstallationManager::installAsync(const QString& source, InstallOptions options, QObject* context,
                                       InstallCallback done)
{
    return Utils::Async::run<InstallOutcome>(
        context,
        [this, source, options = std::move(options)] {
            InstallOutcome outcome;
            outcome.error = install(source, options, outcome.plugin);
            return outcome;
        },
        [done = std::move(done)](InstallOutcome outcome) {
            if (done)
                done(outcome.error, outcome.plugin);
        },
        &m_pool);
}

void InstallationManager::waitForPendingInstalls()
{
    m_pool.waitForDone();
}

PluginError InstallationManager::uninstall(const QString& pluginId)
{
    QReadLocker scanLocker(&m_scanLock);
    const auto idLock = m_idLocks.lock(pluginId);

    Plugin existing;
    if (!plugin(pluginId, existing))
        return PluginError::notFound(QStringLiteral("Plugin %1 is not installed.").arg(pluginId));

    BeforeRemoveHook hook;
    {
        QReadLocker locker(&m_lock);
        hook = m_beforeRemove;
    }
    if (hook)
        hook(pluginId);

    // The record stays when deletion fails so the uninstall can be retried.
    if (const Utils::Result removed = Utils::FileSystemUtils::removeDirectoryRecursively(existing.bundlePath);
        !removed) {
        return PluginError::install(QStringLiteral("Failed to uninstall %1: %2")
                                        .arg(pluginId, removed.errorString()));
    }

    {
        QWriteLocker locker(&m_lock);
        m_installed.remove(pluginId);
        m_store.remove(pluginId);
        if (const Utils::Result written = writeIndexCacheLocked(); !written)
            qCWarning(aicsExtensionSystemLog).noquote() << "Failed to write plugin index:" << written.errorString();
    }

    qCInfo(aicsExtensionSystemLog) << "Uninstalled" << pluginId;
    emit pluginUninstalled(pluginId);
    return PluginError::none();
}

PluginList InstallationManager::installedPlugins() const
{
    QReadLocker locker(&m_lock);
    return sortedById(m_installed.values());
}

bool InstallationManager::plugin(const QString& pluginId, Plugin& out) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_installed.constFind(pluginId);
    if (it == m_installed.cend())
        return false;
    out = it.value();
    return true;
}

bool InstallationManager::isInstalled(const QString& pluginId) const
{
    QReadLocker locker(&m_lock);
    return m_installed.contains(pluginId);
}

Utils::Result InstallationManager::loadIndexCache()
{
    QWriteLocker scanLocker(&m_scanLock);

    const QString path = indexCachePath();
    if (!QFileInfo::exists(path))
        return Utils::Result::failure(QStringLiteral("No plugin index at %1.").arg(path));

    QString readError;
    const QJsonObject root = Utils::JsonFileUtils::readObject(path, &readError);
    if (!readError.isEmpty())
        return Utils::Result::failure(readError);
    if (root.value(kFormatKey).toInt() != kIndexCacheFormat)
        return Utils::Result::failure(QStringLiteral("Unsupported plugin index format in %1.").arg(path));

    PluginList restored;
    QSet<QString> seen;
    const QJsonArray entries = root.value(kPluginsKey).toArray();
    for (const QJsonValue& value : entries) {
        const QJsonObject entry = value.toObject();
        const QString id = entry.value(kIdKey).toString();
        const QString bundlePath = entry.value(kBundlePathKey).toString();
        if (!PluginBundle::isBundlePath(bundlePath)) {
            qCInfo(aicsExtensionSystemLog) << "Dropping index entry" << id << "- bundle" << bundlePath << "is gone";
            continue;
        }

        PluginManifest manifest;
        if (const PluginError err = m_store.loadFromBundle(bundlePath, manifest); !err.ok()) {
            qCWarning(aicsExtensionSystemLog).noquote() << "Dropping index entry" << id << "-" << err.toString();
            continue;
        }
        if (manifest.id != id || seen.contains(id) || manifest.requiresNewerHost(m_settings.hostVersion)) {
            qCWarning(aicsExtensionSystemLog) << "Dropping stale index entry" << id;
            continue;
        }

        seen.insert(id);
        restored.push_back(Plugin{std::move(manifest), bundlePath});
    }

    replaceInstalledSet(restored);
    emit pluginsDiscovered(int(restored.size()));
    return Utils::Result::success();
}

Utils::Result InstallationManager::writeIndexCacheLocked() const
{
    if (!QFileInfo(m_settings.managedDirectory).isDir())
        return Utils::Result::success();

    QJsonArray entries;
    for (const Plugin& plugin : sortedById(m_installed.values())) {
        QJsonObject entry;
        entry.insert(kIdKey, plugin.id());
        entry.insert(kBundlePathKey, plugin.bundlePath);
        entries.push_back(entry);
    }

    QJsonObject root;
    root.insert(kFormatKey, kIndexCacheFormat);
    root.insert(kPluginsKey, entries);
    return Utils::JsonFileUtils::writeObjectAtomic(indexCachePath(), root);
}

} // namespace aics
