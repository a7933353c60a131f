// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "TestSupport.hpp"

#include "extensionsystem/ActivationEngine.hpp"
#include "extensionsystem/HostApi.hpp"

#include <utils/async/KeyedMutex.hpp>

#include <QtCore/QDeadlineTimer>
#include <QtCore/QElapsedTimer>
#include <QtTest/QSignalSpy>

using namespace aics;
using namespace aics::test;

namespace {

PluginManifest withDependencies(const QString& id, const QStringList& dependencies)
{
    PluginManifest manifest = makeManifest(id);
    manifest.dependencies = dependencies;
    return manifest;
}

// Abandoned hooks keep their instance until the worker returns.
bool waitForLiveCount(const InstanceTracker& tracker, int expected, int timeoutMs = 5000)
{
    QDeadlineTimer deadline(timeoutMs);
    while (tracker.live.load() != expected) {
        if (deadline.hasExpired())
            return false;
        QThread::msleep(10);
    }
    return true;
}

} // namespace

TEST(ActivationEngineTests, ActivatingTwiceKeepsTheSameInstance)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    ActivationEngine& engine = env.manager().engine();

    ASSERT_TRUE(engine.activate("com.example.a").ok());
    const std::shared_ptr<PluginInstance> first = engine.instance("com.example.a");
    ASSERT_TRUE(first);

    ASSERT_TRUE(engine.activate("com.example.a").ok());
    EXPECT_EQ(engine.instance("com.example.a"), first);
    EXPECT_EQ(env.tracker->created.load(), 1);
    EXPECT_EQ(engine.state("com.example.a"), ActivationState::Active);
}

TEST(ActivationEngineTests, DeactivatingInactivePluginIsNoOp)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    ActivationEngine& engine = env.manager().engine();
    QSignalSpy stateSpy(&engine, &ActivationEngine::stateChanged);

    engine.deactivate("com.example.a");
    engine.deactivate("com.example.unknown");

    EXPECT_EQ(stateSpy.count(), 0);
    EXPECT_EQ(env.tracker->cleanups.load(), 0);
    EXPECT_EQ(engine.state("com.example.a"), ActivationState::Inactive);
}

TEST(ActivationEngineTests, ReactivationLeavesExactlyOneLiveInstance)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    ActivationEngine& engine = env.manager().engine();

    ASSERT_TRUE(engine.activate("com.example.a").ok());
    engine.deactivate("com.example.a");
    EXPECT_EQ(env.tracker->live.load(), 0);
    ASSERT_TRUE(engine.activate("com.example.a").ok());

    EXPECT_TRUE(engine.isActive("com.example.a"));
    EXPECT_EQ(env.tracker->live.load(), 1);
    EXPECT_EQ(env.tracker->created.load(), 2);
    EXPECT_EQ(env.tracker->cleanups.load(), 1);
}

TEST(ActivationEngineTests, StateChangesFollowLifecycle)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    ActivationEngine& engine = env.manager().engine();
    QSignalSpy stateSpy(&engine, &ActivationEngine::stateChanged);
    QSignalSpy activatedSpy(&engine, &ActivationEngine::activated);
    QSignalSpy deactivatedSpy(&engine, &ActivationEngine::deactivated);

    ASSERT_TRUE(engine.activate("com.example.a").ok());
    engine.deactivate("com.example.a");

    QList<ActivationState> states;
    for (const QList<QVariant>& args : std::as_const(stateSpy)) {
        EXPECT_EQ(args.at(0).toString(), "com.example.a");
        states.push_back(args.at(1).value<ActivationState>());
    }
    EXPECT_EQ(states, (QList<ActivationState>{ActivationState::Activating, ActivationState::Active,
                                              ActivationState::Deactivating, ActivationState::Inactive}));
    EXPECT_EQ(activatedSpy.count(), 1);
    EXPECT_EQ(deactivatedSpy.count(), 1);
}

TEST(ActivationEngineTests, UnknownPluginIsNotFound)
{
    TestHostEnvironment env;
    EXPECT_EQ(env.manager().activate("com.example.ghost").code(), PluginErrorCode::NotFound);
}

TEST(ActivationEngineTests, FailingInitializeIsLoadError)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.fail"), InitBehavior::Fail);
    ActivationEngine& engine = env.manager().engine();
    QSignalSpy failedSpy(&engine, &ActivationEngine::activationFailed);

    const PluginError err = engine.activate("com.example.fail");
    EXPECT_EQ(err.code(), PluginErrorCode::LoadError);
    EXPECT_TRUE(err.message().contains("refusing to start")) << err.message().toStdString();
    EXPECT_EQ(engine.state("com.example.fail"), ActivationState::Inactive);
    EXPECT_FALSE(engine.instance("com.example.fail"));
    EXPECT_TRUE(engine.activePluginIds().isEmpty());
    EXPECT_EQ(failedSpy.count(), 1);
    EXPECT_TRUE(waitForLiveCount(*env.tracker, 0));
}

TEST(ActivationEngineTests, ThrowingInitializeIsLoadError)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.throw"), InitBehavior::Throw);
    ActivationEngine& engine = env.manager().engine();

    const PluginError err = engine.activate("com.example.throw");
    EXPECT_EQ(err.code(), PluginErrorCode::LoadError);
    EXPECT_TRUE(err.message().contains("initialize exploded")) << err.message().toStdString();
    EXPECT_EQ(engine.state("com.example.throw"), ActivationState::Inactive);
    EXPECT_TRUE(waitForLiveCount(*env.tracker, 0));
}

TEST(ActivationEngineTests, HangingInitializeTimesOut)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.hang"), InitBehavior::Hang);
    ActivationEngine& engine = env.manager().engine();

    QElapsedTimer timer;
    timer.start();
    const PluginError err = engine.activate("com.example.hang");
    EXPECT_LT(timer.elapsed(), 1400) << "activation must not wait for the hanging hook";

    EXPECT_EQ(err.code(), PluginErrorCode::LoadError);
    EXPECT_TRUE(err.message().contains("did not return")) << err.message().toStdString();
    EXPECT_EQ(engine.state("com.example.hang"), ActivationState::Inactive);
    EXPECT_FALSE(engine.isActive("com.example.hang"));

    EXPECT_TRUE(waitForLiveCount(*env.tracker, 0));
}

TEST(ActivationEngineTests, DependenciesActivateFirst)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.base"));
    env.install(withDependencies("com.example.mid", {"com.example.base"}));
    env.install(withDependencies("com.example.top", {"com.example.mid", "com.example.base"}));

    const PluginError err = env.manager().activate("com.example.top");
    ASSERT_TRUE(err.ok()) << err.toString().toStdString();

    EXPECT_EQ(env.tracker->initializationOrder(),
              (QStringList{"com.example.base", "com.example.mid", "com.example.top"}));
    EXPECT_EQ(env.manager().engine().activePluginIds(),
              (QStringList{"com.example.base", "com.example.mid", "com.example.top"}));
}

TEST(ActivationEngineTests, DeactivateAllRunsInReverseOrder)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.base"));
    env.install(withDependencies("com.example.top", {"com.example.base"}));
    ActivationEngine& engine = env.manager().engine();
    ASSERT_TRUE(engine.activate("com.example.top").ok());

    QSignalSpy deactivatedSpy(&engine, &ActivationEngine::deactivated);
    engine.deactivateAll();

    ASSERT_EQ(deactivatedSpy.count(), 2);
    EXPECT_EQ(deactivatedSpy.at(0).at(0).toString(), "com.example.top");
    EXPECT_EQ(deactivatedSpy.at(1).at(0).toString(), "com.example.base");
    EXPECT_TRUE(engine.activePluginIds().isEmpty());
    EXPECT_EQ(env.tracker->live.load(), 0);
}

TEST(ActivationEngineTests, MissingDependencyIsLoadError)
{
    TestHostEnvironment env;
    env.install(withDependencies("com.example.top", {"com.example.absent"}));

    const PluginError err = env.manager().activate("com.example.top");
    EXPECT_EQ(err.code(), PluginErrorCode::LoadError);
    EXPECT_TRUE(err.message().contains("com.example.absent")) << err.message().toStdString();
    EXPECT_EQ(env.tracker->created.load(), 0);
}

TEST(ActivationEngineTests, DependencyCycleIsLoadError)
{
    TestHostEnvironment env;
    env.install(withDependencies("com.example.a", {"com.example.b"}));
    env.install(withDependencies("com.example.b", {"com.example.a"}));

    const PluginError err = env.manager().activate("com.example.a");
    EXPECT_EQ(err.code(), PluginErrorCode::LoadError);
    EXPECT_TRUE(err.message().startsWith("Dependency cycle")) << err.message().toStdString();
    EXPECT_EQ(env.tracker->created.load(), 0);
}

TEST(ActivationEngineTests, FailingDependencyStopsActivation)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.base"), InitBehavior::Fail);
    env.install(withDependencies("com.example.top", {"com.example.base"}));

    const PluginError err = env.manager().activate("com.example.top");
    EXPECT_EQ(err.code(), PluginErrorCode::LoadError);
    EXPECT_TRUE(err.message().contains("Dependency com.example.base")) << err.message().toStdString();
    EXPECT_FALSE(env.manager().engine().isActive("com.example.top"));
    EXPECT_EQ(env.tracker->created.load(), 1);
}

TEST(ActivationEngineTests, MissingFactoryIsLoadError)
{
    TestHostEnvironment env;
    Plugin plugin;
    ASSERT_TRUE(env.manager().install(writeBundle(env.sourcesDir(), makeManifest("com.example.orphan")), {}, plugin).ok());

    EXPECT_EQ(env.manager().activate("com.example.orphan").code(), PluginErrorCode::LoadError);
}

TEST(ActivationEngineTests, TooNewPluginIsIncompatibleAtActivation)
{
    TestHostEnvironment env;
    env.config.hostVersion = "2.0.0";
    PluginManifest manifest = makeManifest("com.example.a");
    manifest.minimumAppVersion = "1.5.0";
    env.install(manifest);

    ActivationEngine::Settings settings;
    settings.context = PluginContext("1.0.0", "1.2.0", RuntimeEnvironment::Development);
    Utils::Async::KeyedMutex locks;
    ActivationEngine olderHost(env.manager().installer(), env.loader,
                               std::make_shared<HostApi>(HostServices{}), locks, settings);

    EXPECT_EQ(olderHost.activate("com.example.a").code(), PluginErrorCode::IncompatibleVersion);
    EXPECT_EQ(env.tracker->created.load(), 0);
    EXPECT_TRUE(env.manager().activate("com.example.a").ok());
}

TEST(ActivationEngineTests, CommandsOnlyReachActivePlugins)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));

    const PluginCommand echo{"echo", {{"value", 7}}};
    EXPECT_TRUE(env.manager().executeCommand("com.example.a", echo).isEmpty());

    ASSERT_TRUE(env.manager().activate("com.example.a").ok());
    const PluginCommandResult result = env.manager().executeCommand("com.example.a", echo);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output.value("value").toInt(), 7);

    EXPECT_TRUE(env.manager().executeCommand("com.example.a", {"unknown", {}}).isEmpty());

    env.manager().deactivate("com.example.a");
    EXPECT_TRUE(env.manager().executeCommand("com.example.a", echo).isEmpty());
}

TEST(ActivationEngineTests, ThrowingCommandIsCommandFailed)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    ASSERT_TRUE(env.manager().activate("com.example.a").ok());

    const PluginCommandResult result = env.manager().executeCommand("com.example.a", {"throw", {}});
    EXPECT_TRUE(result.executed);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.code(), PluginErrorCode::CommandFailed);
    EXPECT_TRUE(env.manager().engine().isActive("com.example.a"));
}

TEST(ActivationEngineTests, HostCallsAreBoundToDeclaredPermissions)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.fmt", {}, PluginCapability::Formatter));
    ASSERT_TRUE(env.manager().activate("com.example.fmt").ok());

    const PluginCommandResult result = env.manager().executeCommand("com.example.fmt", {"terminal", {}});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.code(), PluginErrorCode::MissingPermission);
    EXPECT_TRUE(result.error.message().contains("terminal")) << result.error.message().toStdString();
}

TEST(ActivationEngineTests, UiContributionsComeFromActiveInstance)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));

    EXPECT_TRUE(env.manager().uiContributions("com.example.a").isEmpty());

    ASSERT_TRUE(env.manager().activate("com.example.a").ok());
    const QList<PluginUiContribution> items = env.manager().uiContributions("com.example.a");
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items.front().placement, PluginUiContribution::Placement::Sidebar);
    EXPECT_EQ(items.front().id, "com.example.a.sidebar");
}

TEST(ActivationEngineTests, ShutdownDeactivatesEverything)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    env.install(makeManifest("com.example.b"));
    ASSERT_TRUE(env.manager().activate("com.example.a").ok());
    ASSERT_TRUE(env.manager().activate("com.example.b").ok());

    env.manager().shutdown();
    env.manager().shutdown();

    EXPECT_TRUE(env.manager().engine().activePluginIds().isEmpty());
    EXPECT_EQ(env.tracker->cleanups.load(), 2);
    EXPECT_EQ(env.tracker->live.load(), 0);
}

TEST(ActivationEngineTests, ThrowingCleanupStillDeactivates)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"), InitBehavior::Succeed, CleanupBehavior::Throw);
    ActivationEngine& engine = env.manager().engine();
    ASSERT_TRUE(engine.activate("com.example.a").ok());
    QSignalSpy deactivatedSpy(&engine, &ActivationEngine::deactivated);

    engine.deactivate("com.example.a");

    EXPECT_EQ(deactivatedSpy.count(), 1);
    EXPECT_EQ(env.tracker->cleanups.load(), 1);
    EXPECT_EQ(engine.state("com.example.a"), ActivationState::Inactive);
    EXPECT_FALSE(engine.instance("com.example.a"));
    EXPECT_TRUE(engine.activePluginIds().isEmpty());
    EXPECT_TRUE(waitForLiveCount(*env.tracker, 0));

    ASSERT_TRUE(engine.activate("com.example.a").ok());
    EXPECT_EQ(env.tracker->live.load(), 1);
}

TEST(ActivationEngineTests, HangingCleanupIsAbandoned)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"), InitBehavior::Succeed, CleanupBehavior::Hang);
    ActivationEngine& engine = env.manager().engine();
    ASSERT_TRUE(engine.activate("com.example.a").ok());

    QElapsedTimer timer;
    timer.start();
    engine.deactivate("com.example.a");
    EXPECT_LT(timer.elapsed(), 1400) << "deactivation must not wait for the hanging cleanup";

    EXPECT_EQ(engine.state("com.example.a"), ActivationState::Inactive);
    EXPECT_FALSE(engine.instance("com.example.a"));
    EXPECT_TRUE(engine.activePluginIds().isEmpty());
    EXPECT_TRUE(waitForLiveCount(*env.tracker, 0));
}

TEST(ActivationEngineTests, CleanupWaitsForOverrunningCommand)
{
    TestHostEnvironment env;
    env.config.commandTimeoutMs = 100;
    env.config.cleanupTimeoutMs = 2000;
    env.install(makeManifest("com.example.a", PluginPermission::Notifications));
    ActivationEngine& engine = env.manager().engine();
    ASSERT_TRUE(engine.activate("com.example.a").ok());

    const PluginCommandResult result =
        engine.executeCommand("com.example.a", {"sleepNotify", {{"ms", 300}}});
    EXPECT_EQ(result.error.code(), PluginErrorCode::CommandFailed);

    engine.deactivate("com.example.a");

    EXPECT_EQ(env.tracker->recordedEvents(),
              QStringList({"com.example.a:command-returned", "com.example.a:cleanup"}));
    EXPECT_EQ(env.tracker->lateNotifyCode.load(), static_cast<int>(PluginErrorCode::None));
    EXPECT_EQ(env.tracker->overlappingHooks.load(), 0);
    EXPECT_EQ(engine.state("com.example.a"), ActivationState::Inactive);
    EXPECT_TRUE(waitForLiveCount(*env.tracker, 0));
}

TEST(ActivationEngineTests, CommandOutlivingDeactivationSeesRevokedHost)
{
    TestHostEnvironment env;
    env.config.commandTimeoutMs = 100;
    env.config.cleanupTimeoutMs = 50;
    env.install(makeManifest("com.example.a", PluginPermission::Notifications));
    ActivationEngine& engine = env.manager().engine();
    ASSERT_TRUE(engine.activate("com.example.a").ok());

    const PluginCommandResult result =
        engine.executeCommand("com.example.a", {"sleepNotify", {{"ms", 400}}});
    EXPECT_EQ(result.error.code(), PluginErrorCode::CommandFailed);

    engine.deactivate("com.example.a");
    EXPECT_EQ(engine.state("com.example.a"), ActivationState::Inactive);
    EXPECT_FALSE(engine.instance("com.example.a"));

    // The command still holds the revoked host; cleanup runs once it returns.
    EXPECT_TRUE(waitUntil([&] { return env.tracker->cleanups.load() == 1; }));
    EXPECT_EQ(env.tracker->lateNotifyCode.load(), static_cast<int>(PluginErrorCode::NotFound));
    EXPECT_EQ(env.tracker->recordedEvents(),
              QStringList({"com.example.a:command-returned", "com.example.a:cleanup"}));
    EXPECT_EQ(env.tracker->overlappingHooks.load(), 0);
    EXPECT_TRUE(waitForLiveCount(*env.tracker, 0));
}
