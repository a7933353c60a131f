// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginError.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QString>
#include <QtCore/QStringView>

#include <stop_token>

namespace aics {

// Brings a plugin source into a local working directory:
//
//   * a bundle directory is copied,
//   * a .zip/.tar/.tar.gz/.tgz archive is extracted with the system unzip/tar,
//   * an http(s) URL to such an archive is downloaded, then extracted.
//
// Every step gives up with InstallError once `deadline` expires or `stop` is
// requested. Runs synchronously; network transfers spin a local event loop,
// so any thread will do.
class AICS_EXTENSIONSYSTEM_EXPORT BundleFetcher final
{
public:
	enum class SourceKind : quint8 {
		Unknown,
		Directory,
		Archive,
		Url
	};

	static SourceKind classify(const QString& source);
	static bool isArchivePath(QStringView path);

	// `workDir` must exist and should be empty. On success `bundleRoot` is the
	// directory inside `workDir` that holds manifest.json.
	static PluginError fetch(const QString& source,
	                         const QString& workDir,
	                         const QDeadlineTimer& deadline,
	                         std::stop_token stop,
	                         QString& bundleRoot);

private:
	static PluginError copyDirectory(const QString& source, const QString& target,
	                                 const QDeadlineTimer& deadline, const std::stop_token& stop);
	static PluginError extractArchive(const QString& archive, const QString& target,
	                                  const QDeadlineTimer& deadline, const std::stop_token& stop);
	static PluginError download(const QString& url, const QString& targetFile,
	                            const QDeadlineTimer& deadline, const std::stop_token& stop);
	static PluginError checkContained(const QString& root);
};

} // namespace aics
