// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/BundleFetcher.hpp"

#include "extensionsystem/PluginBundle.hpp"

#include <utils/PathUtils.hpp>
#include <utils/filesystem/FileSystemUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QDirIterator>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QTimer>
#include <QtCore/QUrl>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <memory>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

constexpr int kPollIntervalMs = 50;

bool interrupted(const QDeadlineTimer& deadline, const std::stop_token& stop)
{
    return stop.stop_requested() || deadline.hasExpired();
}

PluginError interruptedError(const QString& what, const std::stop_token& stop)
{
    return PluginError::install(stop.stop_requested()
                                    ? QStringLiteral("%1 was cancelled.").arg(what)
                                    : QStringLiteral("%1 timed out.").arg(what));
}

bool hasSuffix(QStringView path, QStringView suffix)
{
    return path.endsWith(suffix, Qt::CaseInsensitive);
}

bool isZip(QStringView path)
{
    return hasSuffix(path, u".zip");
}

// File name kept for a downloaded archive, so the extractor sees its type.
QString archiveSuffix(QStringView path)
{
    static const QStringList suffixes = {u".tar.gz"_s, u".tgz"_s, u".tar"_s, u".zip"_s};
    for (const QString& suffix : suffixes) {
        if (hasSuffix(path, suffix))
            return suffix;
    }
    return {};
}

} // namespace

bool BundleFetcher::isArchivePath(QStringView path)
{
    return !archiveSuffix(path).isEmpty();
}

BundleFetcher::SourceKind BundleFetcher::classify(const QString& source)
{
    const QUrl url(source);
    const QString scheme = url.scheme().toLower();
    if (scheme == u"http"_s || scheme == u"https"_s)
        return SourceKind::Url;

    const QString path = url.isLocalFile() ? url.toLocalFile() : source;
    const QFileInfo info(path);
    if (info.isDir())
        return SourceKind::Directory;
    if (info.isFile() && isArchivePath(path))
        return SourceKind::Archive;
    return SourceKind::Unknown;
}

PluginError BundleFetcher::fetch(const QString& source,
                                 const QString& workDir,
                                 const QDeadlineTimer& deadline,
                                 std::stop_token stop,
                                 QString& bundleRoot)
{
    bundleRoot.clear();

    const QDir work(workDir);
    if (!work.exists())
        return PluginError::install(QStringLiteral("Working directory %1 does not exist.").arg(workDir));

    const QString unpacked = work.filePath(u"unpacked"_s);
    const QUrl url(source);
    const QString localPath = url.isLocalFile() ? url.toLocalFile() : source;

    PluginError error;
    switch (classify(source)) {
    case SourceKind::Directory:
        error = copyDirectory(localPath, unpacked, deadline, stop);
        break;
    case SourceKind::Archive:
        error = extractArchive(localPath, unpacked, deadline, stop);
        break;
    case SourceKind::Url: {
        const QString suffix = archiveSuffix(url.path());
        if (suffix.isEmpty())
            return PluginError::install(QStringLiteral("%1 does not name a supported archive.").arg(source));

        const QString archive = work.filePath(u"download"_s + suffix);
        error = download(source, archive, deadline, stop);
        if (error.ok())
            error = extractArchive(archive, unpacked, deadline, stop);
        break;
    }
    case SourceKind::Unknown:
        return PluginError::install(QStringLiteral("Unsupported plugin source: %1").arg(source));
    }

    if (!error.ok())
        return error;

    error = checkContained(unpacked);
    if (!error.ok())
        return error;

    bundleRoot = PluginBundle::locateBundleRoot(unpacked);
    if (bundleRoot.isEmpty()) {
        return PluginError::install(QStringLiteral("%1 does not contain a plugin bundle (no %2 found).")
                                        .arg(source, PluginBundle::manifestFileName()));
    }
    return PluginError::none();
}

PluginError BundleFetcher::copyDirectory(const QString& source, const QString& target,
                                         const QDeadlineTimer& deadline, const std::stop_token& stop)
{
    const Utils::Result copied = Utils::FileSystemUtils::copyDirectoryRecursively(
        source, target, [&deadline, &stop] { return interrupted(deadline, stop); });
    if (copied)
        return PluginError::none();
    if (interrupted(deadline, stop))
        return interruptedError(QStringLiteral("Copying %1").arg(source), stop);
    return PluginError::install(copied.errorString());
}

PluginError BundleFetcher::extractArchive(const QString& archive, const QString& target,
                                          const QDeadlineTimer& deadline, const std::stop_token& stop)
{
    if (!QDir().mkpath(target))
        return PluginError::install(QStringLiteral("Failed to create directory: %1").arg(target));

    QString program;
    QStringList arguments;
    if (isZip(archive)) {
        program = u"unzip"_s;
        arguments = {u"-q"_s, u"-o"_s, archive, u"-d"_s, target};
    } else {
        program = u"tar"_s;
        arguments = {u"-xf"_s, archive, u"-C"_s, target};
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        return PluginError::install(QStringLiteral("Failed to start %1: %2").arg(program, process.errorString()));
    }

    while (!process.waitForFinished(kPollIntervalMs)) {
        if (process.state() == QProcess::NotRunning)
            break;
        if (interrupted(deadline, stop)) {
            process.kill();
            process.waitForFinished();
            return interruptedError(QStringLiteral("Extracting %1").arg(archive), stop);
        }
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return PluginError::install(QStringLiteral("%1 failed to extract %2: %3")
                                        .arg(program, archive,
                                             QString::fromLocal8Bit(process.readAll()).trimmed()));
    }

    qCDebug(aicsExtensionSystemLog) << "Extracted" << archive << "into" << target;
    return PluginError::none();
}

PluginError BundleFetcher::download(const QString& url, const QString& targetFile,
                                    const QDeadlineTimer& deadline, const std::stop_token& stop)
{
    QFile out(targetFile);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return PluginError::install(QStringLiteral("Failed to create %1 (%2)").arg(targetFile, out.errorString()));

    QNetworkAccessManager network;
    QNetworkRequest request{QUrl(url)};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);

    QNetworkReply* reply = network.get(request);
    QEventLoop loop;
    bool writeFailed = false;

    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&] {
        if (out.write(reply->readAll()) < 0) {
            writeFailed = true;
            reply->abort();
        }
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(kPollIntervalMs);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&] {
        if (interrupted(deadline, stop))
            reply->abort();
    });
    poll.start();

    if (!reply->isFinished())
        loop.exec();
    poll.stop();

    const std::unique_ptr<QNetworkReply> owned(reply);
    if (reply->bytesAvailable() > 0 && out.write(reply->readAll()) < 0)
        writeFailed = true;

    if (interrupted(deadline, stop))
        return interruptedError(QStringLiteral("Downloading %1").arg(url), stop);
    if (writeFailed)
        return PluginError::install(QStringLiteral("Failed to write %1 (%2)").arg(targetFile, out.errorString()));
    if (reply->error() != QNetworkReply::NoError)
        return PluginError::install(QStringLiteral("Failed to download %1: %2").arg(url, reply->errorString()));
    if (!out.flush())
        return PluginError::install(QStringLiteral("Failed to write %1 (%2)").arg(targetFile, out.errorString()));

    qCDebug(aicsExtensionSystemLog) << "Downloaded" << url << "to" << targetFile << out.size() << "bytes";
    return PluginError::none();
}

PluginError BundleFetcher::checkContained(const QString& root)
{
    // Archives may carry symlinks; none of them may point outside the tree.
    QDirIterator it(root, QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        if (!info.isSymLink())
            continue;

        const QString target = info.canonicalFilePath();
        if (target.isEmpty() || !Utils::PathUtils::isWithinRoot(root, target)) {
            return PluginError::install(QStringLiteral("Bundle entry %1 links outside the bundle.")
                                            .arg(QDir(root).relativeFilePath(info.filePath())));
        }
    }
    return PluginError::none();
}

} // namespace aics
