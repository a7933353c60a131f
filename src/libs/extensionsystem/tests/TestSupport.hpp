// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <gtest/gtest.h>

#include "extensionsystem/InstanceLoader.hpp"
#include "extensionsystem/PluginBundle.hpp"
#include "extensionsystem/PluginHost.hpp"
#include "extensionsystem/PluginInstance.hpp"
#include "extensionsystem/PluginManager.hpp"
#include "extensionsystem/PluginManifest.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QStringList>
#include <QtCore/QTemporaryDir>
#include <QtCore/QThread>

#include <atomic>
#include <memory>
#include <stdexcept>

namespace aics::test {

inline QCoreApplication* ensureApp()
{
    static QCoreApplication* app = []() {
        static int argc = 1;
        static char arg0[] = "extensionsystem-tests";
        static char* argv[] = {arg0, nullptr};
        return new QCoreApplication(argc, argv);
    }();
    return app;
}

inline void writeFile(const QString& path, const QByteArray& content)
{
    ASSERT_TRUE(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    ASSERT_EQ(file.write(content), content.size());
}

// Polls `condition` while spinning the event loop.
template <typename Fn>
bool waitUntil(Fn condition, int timeoutMs = 3000)
{
    for (int waited = 0; waited < timeoutMs; waited += 10) {
        if (condition())
            return true;
        QCoreApplication::processEvents();
        QThread::msleep(10);
    }
    return condition();
}

inline QByteArray readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return {};
    return file.readAll();
}

inline PluginManifest makeManifest(const QString& id,
                                   PluginPermissions permissions = {},
                                   PluginCapabilities capabilities = PluginCapability::Commands)
{
    PluginManifest m;
    m.id = id;
    m.name = id + QStringLiteral(" plugin");
    m.version = QStringLiteral("1.0.0");
    m.author = QStringLiteral("Tests");
    m.description = QStringLiteral("Test plugin %1").arg(id);
    m.capabilities = capabilities;
    m.permissions = permissions;
    m.entryPoint = QStringLiteral("bin/plugin.bin");
    m.minimumAppVersion = QStringLiteral("1.0.0");
    return m;
}

// Writes a bundle directory holding the manifest and a placeholder entry point.
inline QString writeBundle(const QString& parentDir, const PluginManifest& manifest)
{
    const QString bundle = QDir(parentDir).filePath(PluginBundle::bundleDirectoryName(manifest.id));
    writeFile(PluginBundle::manifestPath(bundle), manifest.serialize());
    writeFile(QDir(bundle).filePath(manifest.entryPoint), "entry point");
    return bundle;
}

// Shared by every instance a test creates.
struct InstanceTracker {
    std::atomic_int live{0};
    std::atomic_int created{0};
    std::atomic_int cleanups{0};

    std::atomic_int activeHooks{0};
    std::atomic_int overlappingHooks{0};
    std::atomic_int lateNotifyCode{-1}; // PluginErrorCode seen by the "sleepNotify" command

    QMutex mutex;
    QStringList initialized; // plugin ids, in initialization order
    QStringList events;      // "<id>:command-returned", "<id>:cleanup"

    void recordInitialized(const QString& id)
    {
        QMutexLocker locker(&mutex);
        initialized.push_back(id);
    }

    QStringList initializationOrder()
    {
        QMutexLocker locker(&mutex);
        return initialized;
    }

    void recordEvent(const QString& event)
    {
        QMutexLocker locker(&mutex);
        events.push_back(event);
    }

    QStringList recordedEvents()
    {
        QMutexLocker locker(&mutex);
        return events;
    }
};

// Counts hooks inside an instance and notes any overlap.
class HookScope
{
public:
    explicit HookScope(InstanceTracker& tracker) : m_tracker(tracker)
    {
        if (++m_tracker.activeHooks > 1)
            ++m_tracker.overlappingHooks;
    }
    ~HookScope() { --m_tracker.activeHooks; }

private:
    InstanceTracker& m_tracker;
};

enum class InitBehavior {
    Succeed,
    Fail,
    Throw,
    Hang
};

enum class CleanupBehavior {
    Succeed,
    Throw,
    Hang
};

// Commands:
//   echo      -> returns its arguments
//   terminal  -> runs "echo" through the host
//   read      -> reads arguments.path through the host
//   throw     -> throws std::runtime_error
//   sleepNotify -> sleeps arguments.ms, then posts a notification through the host
class TestInstance final : public PluginInstance
{
public:
    TestInstance(QString id, std::shared_ptr<InstanceTracker> tracker, InitBehavior behavior,
                 CleanupBehavior cleanupBehavior = CleanupBehavior::Succeed)
        : m_id(std::move(id)), m_tracker(std::move(tracker)), m_behavior(behavior), m_cleanupBehavior(cleanupBehavior)
    {
        ++m_tracker->live;
        ++m_tracker->created;
    }

    ~TestInstance() override { --m_tracker->live; }

    PluginError initialize(const PluginContext&, PluginHost& host) override
    {
        m_host = &host;
        switch (m_behavior) {
        case InitBehavior::Succeed:
            m_tracker->recordInitialized(m_id);
            return PluginError::none();
        case InitBehavior::Fail:
            return PluginError::load(QStringLiteral("refusing to start"));
        case InitBehavior::Throw:
            throw std::runtime_error("initialize exploded");
        case InitBehavior::Hang:
            QThread::msleep(1500);
            return PluginError::none();
        }
        return PluginError::none();
    }

    void cleanup() override
    {
        HookScope scope(*m_tracker);
        ++m_tracker->cleanups;
        m_tracker->recordEvent(m_id + QStringLiteral(":cleanup"));
        m_host = nullptr;
        if (m_cleanupBehavior == CleanupBehavior::Throw)
            throw std::runtime_error("cleanup exploded");
        if (m_cleanupBehavior == CleanupBehavior::Hang)
            QThread::msleep(1500);
    }

    PluginCommandResult executeCommand(const PluginCommand& command) override
    {
        HookScope scope(*m_tracker);

        if (command.id == QLatin1String("sleepNotify")) {
            QThread::msleep(static_cast<unsigned long>(command.arguments.value(QStringLiteral("ms")).toInt()));
            const PluginError err = m_host->notify(m_id, QStringLiteral("still running"));
            m_tracker->lateNotifyCode = static_cast<int>(err.code());
            m_tracker->recordEvent(m_id + QStringLiteral(":command-returned"));
            return PluginCommandResult::success();
        }

        if (command.id == QLatin1String("echo"))
            return PluginCommandResult::success(command.arguments);

        if (command.id == QLatin1String("terminal")) {
            ProcessOutput output;
            PluginError err = m_host->runCommand(QStringLiteral("echo"), {QStringLiteral("hi")}, output);
            if (!err.ok())
                return PluginCommandResult::failure(std::move(err));
            return PluginCommandResult::success({{QStringLiteral("exitCode"), output.exitCode}});
        }

        if (command.id == QLatin1String("read")) {
            QByteArray contents;
            PluginError err = m_host->readFile(command.arguments.value(QStringLiteral("path")).toString(), contents);
            if (!err.ok())
                return PluginCommandResult::failure(std::move(err));
            return PluginCommandResult::success({{QStringLiteral("text"), QString::fromUtf8(contents)}});
        }

        if (command.id == QLatin1String("throw"))
            throw std::runtime_error("command exploded");

        return PluginCommandResult::empty();
    }

    QList<PluginUiContribution> uiContributions() const override
    {
        PluginUiContribution item;
        item.placement = PluginUiContribution::Placement::Sidebar;
        item.id = m_id + QStringLiteral(".sidebar");
        item.title = m_id;
        item.commandId = QStringLiteral("echo");
        return {item};
    }

    PluginHost* host() const { return m_host; }

private:
    QString m_id;
    std::shared_ptr<InstanceTracker> m_tracker;
    InitBehavior m_behavior;
    CleanupBehavior m_cleanupBehavior;
    PluginHost* m_host = nullptr;
};

// A plugin host over a temporary directory with in-process test plugins.
class TestHostEnvironment
{
public:
    TestHostEnvironment()
    {
        ensureApp();
        config = HostConfig::defaults();
        config.pluginsDirectory = QDir(root.path()).filePath(QStringLiteral("plugins"));
        config.workspaceRoot = QDir(root.path()).filePath(QStringLiteral("workspace"));
        config.activationTimeoutMs = 500;
        config.cleanupTimeoutMs = 500;
        config.commandTimeoutMs = 2000;
        config.installTimeoutMs = 10000;
        config.trust.requireSignature = false;
        QDir().mkpath(config.workspaceRoot);
    }

    QString sourcesDir() const { return QDir(root.path()).filePath(QStringLiteral("sources")); }

    PluginManager& manager()
    {
        if (!m_manager)
            m_manager = std::make_unique<PluginManager>(config, HostServices::createDefaults(config.workspaceRoot), loader);
        return *m_manager;
    }

    void registerPlugin(const QString& id, InitBehavior behavior = InitBehavior::Succeed,
                        CleanupBehavior cleanupBehavior = CleanupBehavior::Succeed)
    {
        loader->registerFactory(id, [id, tracker = tracker, behavior, cleanupBehavior] {
            return std::make_unique<TestInstance>(id, tracker, behavior, cleanupBehavior);
        });
    }

    // Registers a factory, writes a source bundle and installs it.
    Plugin install(const PluginManifest& manifest, InitBehavior behavior = InitBehavior::Succeed,
                   CleanupBehavior cleanupBehavior = CleanupBehavior::Succeed)
    {
        registerPlugin(manifest.id, behavior, cleanupBehavior);
        Plugin installed;
        const PluginError err = manager().install(writeBundle(sourcesDir(), manifest), {}, installed);
        EXPECT_TRUE(err.ok()) << err.toString().toStdString();
        return installed;
    }

    QTemporaryDir root;
    HostConfig config;
    std::shared_ptr<FactoryInstanceLoader> loader = std::make_shared<FactoryInstanceLoader>();
    std::shared_ptr<InstanceTracker> tracker = std::make_shared<InstanceTracker>();

private:
    std::unique_ptr<PluginManager> m_manager;
};

} // namespace aics::test
