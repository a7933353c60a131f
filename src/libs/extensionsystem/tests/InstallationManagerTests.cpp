// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "TestSupport.hpp"

#include "extensionsystem/ActivationEngine.hpp"
#include "extensionsystem/BundleFetcher.hpp"
#include "extensionsystem/InstallationManager.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QEventLoop>
#include <QtCore/QJsonArray>
#include <QtCore/QProcess>
#include <QtCore/QStandardPaths>
#include <QtCore/QTimer>
#include <QtTest/QSignalSpy>

using namespace aics;
using namespace aics::test;

namespace {

QStringList stagingLeftovers(const QString& managedDir)
{
    return QDir(managedDir).entryList({QStringLiteral(".staging-*")},
                                      QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot);
}

} // namespace

TEST(InstallationManagerTests, InstallsBundleFromDirectory)
{
    TestHostEnvironment env;
    InstallationManager& installer = env.manager().installer();
    QSignalSpy installedSpy(&installer, &InstallationManager::pluginInstalled);

    const QString source = writeBundle(env.sourcesDir(), makeManifest("com.example.fmt"));
    Plugin plugin;
    const PluginError err = installer.install(source, {}, plugin);
    ASSERT_TRUE(err.ok()) << err.toString().toStdString();

    EXPECT_EQ(plugin.id(), "com.example.fmt");
    EXPECT_EQ(plugin.bundlePath,
              QDir(env.config.pluginsDirectory).absoluteFilePath("com.example.fmt.aicsplugin"));
    EXPECT_TRUE(PluginBundle::isBundlePath(plugin.bundlePath));
    EXPECT_TRUE(installer.isInstalled("com.example.fmt"));
    EXPECT_TRUE(env.manager().manifestStore().contains("com.example.fmt"));
    EXPECT_TRUE(QFileInfo::exists(source)) << "the source bundle is copied, not moved";
    EXPECT_TRUE(stagingLeftovers(env.config.pluginsDirectory).isEmpty());

    ASSERT_EQ(installedSpy.count(), 1);
    EXPECT_EQ(installedSpy.at(0).at(0).toString(), "com.example.fmt");
}

TEST(InstallationManagerTests, TooNewPluginIsIncompatibleAndLeavesNothingBehind)
{
    TestHostEnvironment env;
    InstallationManager& installer = env.manager().installer();

    PluginManifest manifest = makeManifest("com.example.future");
    manifest.minimumAppVersion = "99.0.0";

    Plugin plugin;
    const PluginError err = installer.install(writeBundle(env.sourcesDir(), manifest), {}, plugin);
    EXPECT_EQ(err.code(), PluginErrorCode::IncompatibleVersion);
    EXPECT_FALSE(installer.isInstalled("com.example.future"));
    EXPECT_FALSE(QFileInfo::exists(QDir(env.config.pluginsDirectory).filePath("com.example.future.aicsplugin")));
    EXPECT_TRUE(stagingLeftovers(env.config.pluginsDirectory).isEmpty());
    EXPECT_FALSE(plugin.isValid());
}

TEST(InstallationManagerTests, InvalidSourcesAreInstallErrors)
{
    TestHostEnvironment env;
    InstallationManager& installer = env.manager().installer();
    Plugin plugin;

    EXPECT_EQ(installer.install(QDir(env.sourcesDir()).filePath("missing"), {}, plugin).code(),
              PluginErrorCode::InstallError);

    const QString emptyDir = QDir(env.sourcesDir()).filePath("empty");
    ASSERT_TRUE(QDir().mkpath(emptyDir));
    EXPECT_EQ(installer.install(emptyDir, {}, plugin).code(), PluginErrorCode::InstallError);

    const QString broken = QDir(env.sourcesDir()).filePath("broken.aicsplugin");
    writeFile(PluginBundle::manifestPath(broken), "{ \"id\": ");
    const PluginError err = installer.install(broken, {}, plugin);
    EXPECT_EQ(err.code(), PluginErrorCode::InstallError);
    EXPECT_TRUE(err.message().startsWith("Invalid plugin bundle")) << err.message().toStdString();

    EXPECT_TRUE(installer.installedPlugins().isEmpty());
}

TEST(InstallationManagerTests, DuplicateInstallFailsUnlessReplacing)
{
    TestHostEnvironment env;
    InstallationManager& installer = env.manager().installer();

    PluginManifest manifest = makeManifest("com.example.fmt");
    const QString source = writeBundle(env.sourcesDir(), manifest);
    Plugin plugin;
    ASSERT_TRUE(installer.install(source, {}, plugin).ok());

    EXPECT_EQ(installer.install(source, {}, plugin).code(), PluginErrorCode::InstallError);

    manifest.version = "1.1.0";
    writeFile(PluginBundle::manifestPath(source), manifest.serialize());

    InstallOptions options;
    options.replaceExisting = true;
    const PluginError err = installer.install(source, options, plugin);
    ASSERT_TRUE(err.ok()) << err.toString().toStdString();
    EXPECT_EQ(plugin.manifest.version, "1.1.0");

    ASSERT_EQ(installer.installedPlugins().size(), 1);
    EXPECT_EQ(installer.installedPlugins().front().manifest.version, "1.1.0");
    EXPECT_EQ(env.manager().manifestStore().manifest("com.example.fmt")->version, "1.1.0");
    EXPECT_TRUE(stagingLeftovers(env.config.pluginsDirectory).isEmpty());
}

TEST(InstallationManagerTests, ReplacingDeactivatesTheRunningInstance)
{
    TestHostEnvironment env;
    const PluginManifest manifest = makeManifest("com.example.fmt");
    env.install(manifest);
    ASSERT_TRUE(env.manager().activate("com.example.fmt").ok());
    ASSERT_EQ(env.tracker->live.load(), 1);

    InstallOptions options;
    options.replaceExisting = true;
    ASSERT_TRUE(env.manager().install(writeBundle(env.sourcesDir(), manifest), options).ok());

    EXPECT_FALSE(env.manager().engine().isActive("com.example.fmt"));
    EXPECT_EQ(env.tracker->cleanups.load(), 1);
    EXPECT_EQ(env.tracker->live.load(), 0);
}

TEST(InstallationManagerTests, UninstallRemovesBundleAndRecord)
{
    TestHostEnvironment env;
    const Plugin plugin = env.install(makeManifest("com.example.fmt"));
    InstallationManager& installer = env.manager().installer();
    QSignalSpy uninstalledSpy(&installer, &InstallationManager::pluginUninstalled);

    ASSERT_TRUE(env.manager().activate("com.example.fmt").ok());
    const PluginError err = env.manager().uninstall("com.example.fmt");
    ASSERT_TRUE(err.ok()) << err.toString().toStdString();

    EXPECT_FALSE(installer.isInstalled("com.example.fmt"));
    EXPECT_FALSE(env.manager().manifestStore().contains("com.example.fmt"));
    EXPECT_FALSE(QFileInfo::exists(plugin.bundlePath));
    EXPECT_FALSE(env.manager().engine().isActive("com.example.fmt"));
    EXPECT_EQ(env.tracker->live.load(), 0);
    EXPECT_EQ(uninstalledSpy.count(), 1);

    EXPECT_EQ(env.manager().uninstall("com.example.fmt").code(), PluginErrorCode::NotFound);
}

TEST(InstallationManagerTests, DiscoverSkipsBrokenAndDuplicateBundles)
{
    TestHostEnvironment env;
    const QString dir = env.config.pluginsDirectory;
    writeBundle(dir, makeManifest("com.example.a"));
    writeBundle(dir, makeManifest("com.example.b"));

    PluginManifest future = makeManifest("com.example.future");
    future.minimumAppVersion = "42.0";
    writeBundle(dir, future);

    writeFile(PluginBundle::manifestPath(QDir(dir).filePath("broken.aicsplugin")), "[]");

    // Same id as com.example.a, sorts after it.
    const QString duplicate = QDir(dir).filePath("zz.aicsplugin");
    const PluginManifest dupManifest = makeManifest("com.example.a");
    writeFile(PluginBundle::manifestPath(duplicate), dupManifest.serialize());
    writeFile(QDir(duplicate).filePath(dupManifest.entryPoint), "entry point");

    writeFile(QDir(dir).filePath("notes.txt"), "not a bundle");

    InstallationManager& installer = env.manager().installer();
    QSignalSpy discoveredSpy(&installer, &InstallationManager::pluginsDiscovered);
    const PluginList found = installer.discover();

    ASSERT_EQ(found.size(), 2);
    EXPECT_EQ(found.at(0).id(), "com.example.a");
    EXPECT_EQ(found.at(0).bundlePath, QDir(dir).absoluteFilePath("com.example.a.aicsplugin"));
    EXPECT_EQ(found.at(1).id(), "com.example.b");
    ASSERT_EQ(discoveredSpy.count(), 1);
    EXPECT_EQ(discoveredSpy.at(0).at(0).toInt(), 2);
    EXPECT_EQ(env.manager().manifestStore().size(), 2);
}

TEST(InstallationManagerTests, DiscoverDeactivatesPluginsWhoseBundleIsGone)
{
    TestHostEnvironment env;
    const Plugin gone = env.install(makeManifest("com.example.gone"));
    env.install(makeManifest("com.example.kept"));
    ASSERT_TRUE(env.manager().activate("com.example.gone").ok());
    ASSERT_TRUE(env.manager().activate("com.example.kept").ok());

    ASSERT_TRUE(QDir(gone.bundlePath).removeRecursively());
    env.manager().discover();

    const ActivationEngine& engine = env.manager().engine();
    EXPECT_FALSE(env.manager().installer().isInstalled("com.example.gone"));
    EXPECT_FALSE(engine.isActive("com.example.gone"));
    EXPECT_TRUE(engine.isActive("com.example.kept"));
    EXPECT_EQ(engine.activePluginIds(), QStringList{"com.example.kept"});
    EXPECT_EQ(env.tracker->cleanups.load(), 1);
    EXPECT_EQ(env.tracker->live.load(), 1);
    EXPECT_EQ(env.manager().uninstall("com.example.gone").code(), PluginErrorCode::NotFound);
}

TEST(InstallationManagerTests, DiscoverOfAnotherDirectoryDeactivatesEverything)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    ASSERT_TRUE(env.manager().activate("com.example.a").ok());

    const QString other = QDir(env.root.path()).filePath("other");
    ASSERT_TRUE(QDir().mkpath(other));
    EXPECT_TRUE(env.manager().installer().discover(other).isEmpty());

    EXPECT_TRUE(env.manager().engine().activePluginIds().isEmpty());
    EXPECT_EQ(env.tracker->live.load(), 0);
}

TEST(InstallationManagerTests, RestoringIndexDeactivatesDroppedPlugins)
{
    TestHostEnvironment env;
    const Plugin gone = env.install(makeManifest("com.example.gone"));
    ASSERT_TRUE(env.manager().activate("com.example.gone").ok());

    ASSERT_TRUE(QDir(gone.bundlePath).removeRecursively());
    ASSERT_TRUE(env.manager().installer().loadIndexCache());

    EXPECT_FALSE(env.manager().installer().isInstalled("com.example.gone"));
    EXPECT_FALSE(env.manager().engine().isActive("com.example.gone"));
    EXPECT_EQ(env.tracker->cleanups.load(), 1);
}

TEST(InstallationManagerTests, InstallsRacingDiscoverAreKept)
{
    TestHostEnvironment env;
    InstallationManager& installer = env.manager().installer();

    QStringList sources;
    for (int i = 0; i < 8; ++i)
        sources.push_back(writeBundle(env.sourcesDir(), makeManifest(QStringLiteral("com.example.p%1").arg(i))));

    std::atomic_bool installing{true};
    std::unique_ptr<QThread> scanner(QThread::create([&] {
        while (installing.load())
            installer.discover();
    }));
    scanner->start();

    for (const QString& source : std::as_const(sources)) {
        Plugin plugin;
        const PluginError err = installer.install(source, {}, plugin);
        EXPECT_TRUE(err.ok()) << err.toString().toStdString();
    }
    installing = false;
    ASSERT_TRUE(scanner->wait(10000));

    for (int i = 0; i < 8; ++i)
        EXPECT_TRUE(installer.isInstalled(QStringLiteral("com.example.p%1").arg(i))) << i;
    EXPECT_EQ(installer.installedPlugins().size(), 8);
}

TEST(InstallationManagerTests, DiscoverOfMissingDirectoryIsEmpty)
{
    TestHostEnvironment env;
    EXPECT_TRUE(env.manager().installer().discover(QDir(env.root.path()).filePath("nowhere")).isEmpty());
}

TEST(InstallationManagerTests, IndexCacheRestoresInstalledSet)
{
    TestHostEnvironment env;
    env.install(makeManifest("com.example.a"));
    const Plugin b = env.install(makeManifest("com.example.b"));

    const QString cachePath = env.manager().installer().indexCachePath();
    QString error;
    const QJsonObject cache = Utils::JsonFileUtils::readObject(cachePath, &error);
    ASSERT_TRUE(error.isEmpty()) << error.toStdString();
    EXPECT_EQ(cache.value("format").toInt(), 1);
    EXPECT_EQ(cache.value("plugins").toArray().size(), 2);

    // A bundle deleted behind the host's back is dropped on restore.
    ASSERT_TRUE(QDir(b.bundlePath).removeRecursively());

    PluginManager restored(env.config, HostServices::createDefaults(env.config.workspaceRoot), env.loader);
    const Utils::Result loaded = restored.installer().loadIndexCache();
    ASSERT_TRUE(loaded.ok) << loaded.errorString().toStdString();

    const PluginList plugins = restored.installer().installedPlugins();
    ASSERT_EQ(plugins.size(), 1);
    EXPECT_EQ(plugins.front().id(), "com.example.a");
}

TEST(InstallationManagerTests, MissingOrCorruptIndexCacheFails)
{
    TestHostEnvironment env;
    InstallationManager& installer = env.manager().installer();
    EXPECT_FALSE(installer.loadIndexCache().ok);

    writeFile(installer.indexCachePath(), R"({"format": 7, "plugins": []})");
    EXPECT_FALSE(installer.loadIndexCache().ok);

    writeFile(QDir(env.config.pluginsDirectory).filePath("com.example.a.aicsplugin/manifest.json"),
              makeManifest("com.example.a").serialize());
    writeFile(QDir(env.config.pluginsDirectory).filePath("com.example.a.aicsplugin/bin/plugin.bin"), "x");
    const PluginList restored = env.manager().restore();
    ASSERT_EQ(restored.size(), 1);
    EXPECT_EQ(restored.front().id(), "com.example.a");
}

TEST(InstallationManagerTests, StopRequestCancelsInstall)
{
    TestHostEnvironment env;
    std::stop_source stop;
    stop.request_stop();

    InstallOptions options;
    options.stopToken = stop.get_token();

    Plugin plugin;
    const PluginError err = env.manager().installer().install(
        writeBundle(env.sourcesDir(), makeManifest("com.example.fmt")), options, plugin);
    EXPECT_EQ(err.code(), PluginErrorCode::InstallError);
    EXPECT_FALSE(env.manager().installer().isInstalled("com.example.fmt"));
    EXPECT_TRUE(stagingLeftovers(env.config.pluginsDirectory).isEmpty());
}

TEST(InstallationManagerTests, SignatureRequiredByPolicy)
{
    TestHostEnvironment env;
    env.config.trust.requireSignature = true;
    env.config.trust.publisherKeys.insert("publisher", "s3cret");

    const QString unsignedSource = writeBundle(env.sourcesDir(), makeManifest("com.example.unsigned"));
    Plugin plugin;
    EXPECT_EQ(env.manager().install(unsignedSource, {}, plugin).code(), PluginErrorCode::InstallError);

    const QString signedSource = writeBundle(env.sourcesDir(), makeManifest("com.example.signed"));
    ASSERT_TRUE(BundleVerifier::sign(signedSource, "publisher", "s3cret").ok);
    const PluginError err = env.manager().install(signedSource, {}, plugin);
    EXPECT_TRUE(err.ok()) << err.toString().toStdString();
}

TEST(InstallationManagerTests, InstallAsyncReportsOnContextThread)
{
    TestHostEnvironment env;
    const QString source = writeBundle(env.sourcesDir(), makeManifest("com.example.async"));

    QObject context;
    QEventLoop loop;
    PluginError reported = PluginError::notFound("not called");
    Plugin reportedPlugin;
    QThread* callbackThread = nullptr;

    ASSERT_TRUE(env.manager().installAsync(source, {}, &context,
                                           [&](const PluginError& err, const Plugin& plugin) {
                                               reported = err;
                                               reportedPlugin = plugin;
                                               callbackThread = QThread::currentThread();
                                               loop.quit();
                                           }));

    QTimer::singleShot(10000, &loop, &QEventLoop::quit);
    loop.exec();

    EXPECT_TRUE(reported.ok()) << reported.toString().toStdString();
    EXPECT_EQ(reportedPlugin.id(), "com.example.async");
    EXPECT_EQ(callbackThread, QThread::currentThread());
    EXPECT_TRUE(env.manager().installer().isInstalled("com.example.async"));
}

TEST(InstallationManagerTests, InstallsFromTarArchive)
{
    const QString tar = QStandardPaths::findExecutable("tar");
    if (tar.isEmpty())
        GTEST_SKIP() << "tar is not available";

    TestHostEnvironment env;
    writeBundle(env.sourcesDir(), makeManifest("com.example.packed"));
    const QString archive = QDir(env.root.path()).filePath("packed.tar");

    QProcess process;
    process.start(tar, {"-cf", archive, "-C", env.sourcesDir(), "com.example.packed.aicsplugin"});
    ASSERT_TRUE(process.waitForFinished(10000));
    ASSERT_EQ(process.exitCode(), 0) << process.readAllStandardError().toStdString();

    EXPECT_EQ(BundleFetcher::classify(archive), BundleFetcher::SourceKind::Archive);

    Plugin plugin;
    const PluginError err = env.manager().install(archive, {}, plugin);
    ASSERT_TRUE(err.ok()) << err.toString().toStdString();
    EXPECT_EQ(plugin.id(), "com.example.packed");
    EXPECT_TRUE(QFileInfo::exists(QDir(plugin.bundlePath).filePath("bin/plugin.bin")));
}

TEST(InstallationManagerTests, ClassifiesSources)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    EXPECT_EQ(BundleFetcher::classify(temp.path()), BundleFetcher::SourceKind::Directory);
    EXPECT_EQ(BundleFetcher::classify("https://example.com/p.zip"), BundleFetcher::SourceKind::Url);

    const QString archive = QDir(temp.path()).filePath("p.tar.gz");
    EXPECT_EQ(BundleFetcher::classify(archive), BundleFetcher::SourceKind::Unknown) << "archive does not exist yet";
    writeFile(archive, "not really gzip");
    EXPECT_EQ(BundleFetcher::classify(archive), BundleFetcher::SourceKind::Archive);

    const QString rar = QDir(temp.path()).filePath("p.rar");
    writeFile(rar, "rar");
    EXPECT_EQ(BundleFetcher::classify(rar), BundleFetcher::SourceKind::Unknown);

    EXPECT_TRUE(BundleFetcher::isArchivePath(u"bundle.TGZ"));
    EXPECT_FALSE(BundleFetcher::isArchivePath(u"bundle.txt"));
}
