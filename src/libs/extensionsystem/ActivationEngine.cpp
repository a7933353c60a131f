// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/ActivationEngine.hpp"

#include "extensionsystem/HostApi.hpp"
#include "extensionsystem/InstallationManager.hpp"
#include "extensionsystem/InstanceLoader.hpp"
#include "extensionsystem/PluginHost.hpp"

#include <utils/async/KeyedMutex.hpp>

#include <QtCore/QDeadlineTimer>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QReadLocker>
#include <QtCore/QThread>
#include <QtCore/QWaitCondition>
#include <QtCore/QWriteLocker>

#include <exception>
#include <functional>
#include <utility>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

constexpr int kMinHookThreads = 4;

template <typename R>
struct HookCall {
    QMutex mutex;
    QWaitCondition finished;
    bool done = false;
    bool threw = false;
    QString exceptionMessage;
    R result{};
};

} // namespace

ActivationEngine::ActivationEngine(const InstallationManager& installer,
                                   std::shared_ptr<IInstanceLoader> loader,
                                   std::shared_ptr<const HostApi> api,
                                   Utils::Async::KeyedMutex& idLocks,
                                   Settings settings,
                                   QObject* parent)
    : QObject(parent)
    , m_installer(installer)
    , m_loader(std::move(loader))
    , m_api(std::move(api))
    , m_idLocks(idLocks)
    , m_settings(std::move(settings))
    , m_hostVersion(QVersionNumber::fromString(m_settings.context.appVersion()))
    , m_hookPool(std::make_unique<QThreadPool>())
{
    qRegisterMetaType<aics::ActivationState>();
    m_hookPool->setObjectName(u"aics-plugin-hooks"_s);
    m_hookPool->setMaxThreadCount(qMax(kMinHookThreads, QThread::idealThreadCount()));
}

ActivationEngine::~ActivationEngine()
{
    deactivateAll();

    if (!m_hookPool->waitForDone(m_settings.cleanupTimeoutMs)) {
        // Overrunning hooks still reference the pool; waiting could block forever.
        qCCritical(aicsExtensionSystemLog) << "Plugin hooks are still running at shutdown; abandoning them";
        (void)m_hookPool.release();
    }
}

template <typename R, typename Fn>
bool ActivationEngine::runHook(const QString& pluginId, const char* hook, int timeoutMs,
                               std::shared_ptr<QMutex> hookMutex, Fn&& fn, R& out, QString& failure)
{
    auto call = std::make_shared<HookCall<R>>();

    m_hookPool->start([call, hookMutex = std::move(hookMutex), fn = std::forward<Fn>(fn)]() mutable {
        R result{};
        bool threw = false;
        QString message;
        try {
            QMutexLocker hookLocker(hookMutex.get());
            result = fn();
        } catch (const std::exception& e) {
            threw = true;
            message = QString::fromLocal8Bit(e.what());
        } catch (...) {
            threw = true;
            message = u"non-standard exception"_s;
        }

        QMutexLocker locker(&call->mutex);
        call->result = std::move(result);
        call->threw = threw;
        call->exceptionMessage = std::move(message);
        call->done = true;
        call->finished.wakeAll();
    });

    const QDeadlineTimer deadline(timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever) : QDeadlineTimer(timeoutMs));
    QMutexLocker locker(&call->mutex);
    while (!call->done) {
        if (!call->finished.wait(&call->mutex, deadline))
            break;
    }

    if (!call->done) {
        failure = QStringLiteral("%1 of plugin %2 did not return within %3 ms.")
                      .arg(QLatin1StringView(hook), pluginId)
                      .arg(timeoutMs);
        return false;
    }
    if (call->threw) {
        failure = QStringLiteral("%1 of plugin %2 threw: %3")
                      .arg(QLatin1StringView(hook), pluginId, call->exceptionMessage);
        return false;
    }

    out = std::move(call->result);
    return true;
}

PluginError ActivationEngine::resolveActivationOrder(const QString& pluginId, QStringList& order) const
{
    enum class Mark { Visiting, Done };
    QHash<QString, Mark> marks;
    QStringList path;

    std::function<PluginError(const QString&)> visit = [&](const QString& id) -> PluginError {
        if (const auto it = marks.constFind(id); it != marks.cend()) {
            if (it.value() == Mark::Done)
                return PluginError::none();
            path.push_back(id);
            return PluginError::load(QStringLiteral("Dependency cycle: %1").arg(path.join(u" -> "_s)));
        }

        Plugin plugin;
        if (!m_installer.plugin(id, plugin)) {
            if (path.isEmpty())
                return PluginError::notFound(QStringLiteral("Plugin %1 is not installed.").arg(id));
            return PluginError::load(QStringLiteral("Plugin %1 depends on %2, which is not installed.")
                                         .arg(path.back(), id));
        }

        marks.insert(id, Mark::Visiting);
        path.push_back(id);
        for (const QString& dependency : plugin.manifest.dependencies) {
            if (PluginError err = visit(dependency); !err.ok())
                return err;
        }
        path.pop_back();
        marks.insert(id, Mark::Done);
        order.push_back(id);
        return PluginError::none();
    };

    order.clear();
    return visit(pluginId);
}

PluginError ActivationEngine::activate(const QString& pluginId)
{
    if (isActive(pluginId))
        return PluginError::none();

    QStringList order;
    if (PluginError err = resolveActivationOrder(pluginId, order); !err.ok()) {
        qCWarning(aicsExtensionSystemLog).noquote() << "Cannot activate" << pluginId << "-" << err.toString();
        emit activationFailed(pluginId, err.message());
        return err;
    }

    for (const QString& id : std::as_const(order)) {
        PluginError err = activateOne(id);
        if (err.ok())
            continue;
        if (id == pluginId)
            return err;

        PluginError dependencyError = PluginError::load(
            QStringLiteral("Dependency %1 of %2 failed to activate: %3").arg(id, pluginId, err.message()));
        emit activationFailed(pluginId, dependencyError.message());
        return dependencyError;
    }
    return PluginError::none();
}

PluginError ActivationEngine::activateOne(const QString& pluginId)
{
    const auto idLock = m_idLocks.lock(pluginId);

    if (state(pluginId) == ActivationState::Active)
        return PluginError::none();

    const auto fail = [this, &pluginId](PluginError err) {
        qCWarning(aicsExtensionSystemLog).noquote() << "Activation of" << pluginId << "failed -" << err.toString();
        emit activationFailed(pluginId, err.message());
        return err;
    };

    Plugin plugin;
    if (!m_installer.plugin(pluginId, plugin))
        return fail(PluginError::notFound(QStringLiteral("Plugin %1 is not installed.").arg(pluginId)));

    if (plugin.manifest.requiresNewerHost(m_hostVersion)) {
        return fail(PluginError::incompatible(QStringLiteral("Plugin %1 requires host version %2 (running %3).")
                                                  .arg(pluginId, plugin.manifest.minimumAppVersion,
                                                       m_hostVersion.toString())));
    }

    if (!m_loader)
        return fail(PluginError::load(QStringLiteral("No instance loader is configured.")));

    PluginError loadError;
    std::shared_ptr<PluginInstance> instance = m_loader->load(plugin, loadError);
    if (!instance)
        return fail(loadError.ok() ? PluginError::load(QStringLiteral("Plugin %1 could not be loaded.").arg(pluginId))
                                   : loadError);

    setState(pluginId, ActivationState::Activating);

    auto host = std::make_shared<PluginHost>(m_api, HostCaller{pluginId, plugin.manifest.permissions});
    auto hookMutex = std::make_shared<QMutex>();
    const PluginContext context = m_settings.context;

    PluginError initError;
    QString failure;
    const bool returned = runHook(pluginId, "initialize", m_settings.activationTimeoutMs, hookMutex,
                                  [instance, host, context] { return instance->initialize(context, *host); },
                                  initError, failure);
    if (!returned || !initError.ok()) {
        host->revoke();
        {
            QWriteLocker locker(&m_lock);
            m_entries.remove(pluginId);
        }
        setState(pluginId, ActivationState::Inactive);
        return fail(PluginError::load(
            returned ? QStringLiteral("Plugin %1 failed to initialize: %2").arg(pluginId, initError.toString())
                     : failure));
    }

    {
        QWriteLocker locker(&m_lock);
        Entry& entry = m_entries[pluginId];
        entry.instance = std::move(instance);
        entry.host = std::move(host);
        entry.hookMutex = std::move(hookMutex);
        m_activationOrder.removeAll(pluginId);
        m_activationOrder.push_back(pluginId);
    }
    setState(pluginId, ActivationState::Active);

    qCInfo(aicsExtensionSystemLog) << "Activated" << pluginId << plugin.manifest.version;
    emit activated(pluginId);
    return PluginError::none();
}

void ActivationEngine::deactivate(const QString& pluginId)
{
    const auto idLock = m_idLocks.lock(pluginId);

    Entry entry;
    if (!activeEntry(pluginId, entry))
        return;

    setState(pluginId, ActivationState::Deactivating);

    bool cleaned = false;
    QString failure;
    // Queued behind any command still running in the instance.
    const bool returned = runHook(pluginId, "cleanup", m_settings.cleanupTimeoutMs, entry.hookMutex,
                                  [instance = entry.instance, host = entry.host] {
                                      instance->cleanup();
                                      return true;
                                  },
                                  cleaned, failure);
    if (!returned)
        qCWarning(aicsExtensionSystemLog).noquote() << failure;

    entry.host->revoke();
    {
        QWriteLocker locker(&m_lock);
        m_entries.remove(pluginId);
        m_activationOrder.removeAll(pluginId);
    }
    entry = {};
    setState(pluginId, ActivationState::Inactive);

    qCInfo(aicsExtensionSystemLog) << "Deactivated" << pluginId;
    emit deactivated(pluginId);
}

void ActivationEngine::deactivateAll()
{
    QStringList order;
    {
        QReadLocker locker(&m_lock);
        order = m_activationOrder;
    }
    for (auto it = order.crbegin(); it != order.crend(); ++it)
        deactivate(*it);
}

PluginCommandResult ActivationEngine::executeCommand(const QString& pluginId, const PluginCommand& command)
{
    const auto idLock = m_idLocks.lock(pluginId);

    Entry entry;
    if (!activeEntry(pluginId, entry)) {
        qCDebug(aicsExtensionSystemLog) << "Ignoring command" << command.id << "for inactive plugin" << pluginId;
        return PluginCommandResult::empty();
    }

    PluginCommandResult result;
    QString failure;
    if (!runHook(pluginId, "command", m_settings.commandTimeoutMs, entry.hookMutex,
                 [instance = entry.instance, host = entry.host, command] {
                     return instance->executeCommand(command);
                 },
                 result, failure)) {
        qCWarning(aicsExtensionSystemLog).noquote() << "Command" << command.id << "failed:" << failure;
        return PluginCommandResult::failure(PluginError::commandFailed(failure));
    }
    return result;
}

QList<PluginUiContribution> ActivationEngine::uiContributions(const QString& pluginId)
{
    const auto idLock = m_idLocks.lock(pluginId);

    Entry entry;
    if (!activeEntry(pluginId, entry))
        return {};

    QList<PluginUiContribution> contributions;
    QString failure;
    if (!runHook(pluginId, "uiContributions", m_settings.commandTimeoutMs, entry.hookMutex,
                 [instance = entry.instance, host = entry.host] { return instance->uiContributions(); },
                 contributions, failure)) {
        qCWarning(aicsExtensionSystemLog).noquote() << failure;
        return {};
    }
    return contributions;
}

ActivationState ActivationEngine::state(const QString& pluginId) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_entries.constFind(pluginId);
    return it == m_entries.cend() ? ActivationState::Inactive : it->state;
}

bool ActivationEngine::isActive(const QString& pluginId) const
{
    return state(pluginId) == ActivationState::Active;
}

QStringList ActivationEngine::activePluginIds() const
{
    QReadLocker locker(&m_lock);
    return m_activationOrder;
}

std::shared_ptr<PluginInstance> ActivationEngine::instance(const QString& pluginId) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_entries.constFind(pluginId);
    if (it == m_entries.cend() || it->state != ActivationState::Active)
        return {};
    return it->instance;
}

bool ActivationEngine::activeEntry(const QString& pluginId, Entry& out) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_entries.constFind(pluginId);
    if (it == m_entries.cend() || it->state != ActivationState::Active)
        return false;
    out = it.value();
    return true;
}

void ActivationEngine::setState(const QString& pluginId, ActivationState state)
{
    {
        QWriteLocker locker(&m_lock);
        if (state == ActivationState::Inactive)
            m_entries.remove(pluginId);
        else
            m_entries[pluginId].state = state;
    }
    emit stateChanged(pluginId, state);
}

} // namespace aics
