// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginBundle.hpp"

#include "extensionsystem/PluginManifest.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

const QString kExtension = u"aicsplugin"_s;
const QString kManifestFile = u"manifest.json"_s;
const QString kSignatureFile = u"signature.json"_s;

} // namespace

QString PluginBundle::extension()
{
    return kExtension;
}

QString PluginBundle::manifestFileName()
{
    return kManifestFile;
}

QString PluginBundle::signatureFileName()
{
    return kSignatureFile;
}

bool PluginBundle::hasBundleExtension(QStringView path)
{
    return Utils::PathUtils::hasExtension(path, kExtension);
}

bool PluginBundle::isBundlePath(const QString& path)
{
    return hasBundleExtension(path) && QFileInfo(path).isDir();
}

QString PluginBundle::bundleDirectoryName(const QString& pluginId)
{
    return QStringLiteral("%1.%2").arg(pluginId, kExtension);
}

QString PluginBundle::manifestPath(const QString& bundleDir)
{
    return QDir(bundleDir).filePath(kManifestFile);
}

QString PluginBundle::signaturePath(const QString& bundleDir)
{
    return QDir(bundleDir).filePath(kSignatureFile);
}

bool PluginBundle::readManifestBytes(const QString& bundleDir, QByteArray& out, QString* error)
{
    QFile file(manifestPath(bundleDir));
    if (!file.exists()) {
        if (error)
            *error = QStringLiteral("Bundle %1 has no %2.").arg(bundleDir, kManifestFile);
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Failed to open %1 (%2)").arg(file.fileName(), file.errorString());
        return false;
    }

    out = file.readAll();
    return true;
}

QString PluginBundle::resolveEntryPoint(const QString& bundleDir, const PluginManifest& manifest)
{
    return Utils::PathUtils::resolveWithinRoot(bundleDir, manifest.entryPoint);
}

QString PluginBundle::locateBundleRoot(const QString& unpackedDir)
{
    const QDir dir(unpackedDir);
    if (QFileInfo::exists(dir.filePath(kManifestFile)))
        return dir.absolutePath();

    const QStringList children = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden);
    if (children.size() != 1)
        return {};

    const QString child = dir.absoluteFilePath(children.front());
    if (QFileInfo::exists(QDir(child).filePath(kManifestFile)))
        return child;
    return {};
}

} // namespace aics
