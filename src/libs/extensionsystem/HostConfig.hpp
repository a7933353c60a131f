// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/BundleVerifier.hpp"
#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QVersionNumber>

namespace aics {

// Host settings, read from a JSON file. Every key is optional:
//
//   {
//     "pluginsDirectory": "plugins",
//     "hostVersion": "1.0.0",
//     "apiVersion": "1.0.0",
//     "environment": "development",
//     "activationTimeoutMs": 10000,
//     "cleanupTimeoutMs": 5000,
//     "commandTimeoutMs": 30000,
//     "installTimeoutMs": 120000,
//     "workspaceRoot": ".",
//     "catalog": "catalog.json",
//     "trust": { "requireSignature": true, "publishers": { "acme": "<hex secret>" } }
//   }
//
// Relative paths are resolved against the directory of the file. Unknown
// keys are ignored.
struct AICS_EXTENSIONSYSTEM_EXPORT HostConfig {
	QString pluginsDirectory;
	QString hostVersion;
	QString apiVersion;
	RuntimeEnvironment environment = RuntimeEnvironment::Development;
	int activationTimeoutMs = 10000;
	int cleanupTimeoutMs = 5000;
	int commandTimeoutMs = 30000;
	int installTimeoutMs = 120000;
	QString workspaceRoot;
	QString catalogPath;
	TrustPolicy trust;

	// Plugins under AppDataLocation/Plugins, workspace at the current
	// directory. Signatures are required in production only.
	static HostConfig defaults();

	static Utils::Result loadFile(const QString& path, HostConfig& out);
	static Utils::Result fromJson(const QJsonObject& object, HostConfig& out, const QString& baseDirectory = {});

	QVersionNumber hostVersionNumber() const;
	PluginContext context() const;
};

} // namespace aics
