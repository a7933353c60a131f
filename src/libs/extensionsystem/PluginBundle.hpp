// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringView>

namespace aics {

struct PluginManifest;

// On-disk layout of a plugin bundle:
//
//   <name>.aicsplugin/
//     manifest.json
//     signature.json   (optional, see BundleVerifier)
//     <entry point>    (path named by the manifest)
//
class AICS_EXTENSIONSYSTEM_EXPORT PluginBundle final
{
public:
	static QString extension();
	static QString manifestFileName();
	static QString signatureFileName();

	static bool hasBundleExtension(QStringView path);
	static bool isBundlePath(const QString& path);

	// Directory name used for an installed plugin inside the managed directory.
	static QString bundleDirectoryName(const QString& pluginId);

	static QString manifestPath(const QString& bundleDir);
	static QString signaturePath(const QString& bundleDir);

	static bool readManifestBytes(const QString& bundleDir, QByteArray& out, QString* error = nullptr);

	// Absolute path of the manifest's entry point, or empty when it does not
	// stay inside the bundle.
	static QString resolveEntryPoint(const QString& bundleDir, const PluginManifest& manifest);

	// Given an unpacked tree, returns the directory holding manifest.json:
	// the tree itself, or its only subdirectory. Empty when neither holds one.
	static QString locateBundleRoot(const QString& unpackedDir);
};

} // namespace aics
