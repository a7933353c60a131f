// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"

#include <QtCore/QFlags>
#include <QtCore/QList>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>

#include <optional>

namespace aics {

// What a plugin says it provides. Closed set; manifests naming anything
// else are rejected.
enum class PluginCapability : quint32 {
	Commands        = 1u << 0,
	Ui              = 1u << 1,
	LanguageSupport = 1u << 2,
	Theme           = 1u << 3,
	Snippets        = 1u << 4,
	Linter          = 1u << 5,
	Formatter       = 1u << 6,
	Debugger        = 1u << 7,
	Terminal        = 1u << 8,
	FileSystem      = 1u << 9,
	Network         = 1u << 10,
	Ai              = 1u << 11
};
Q_DECLARE_FLAGS(PluginCapabilities, PluginCapability)

// Privileged host operations a plugin may request. Closed set.
enum class PluginPermission : quint32 {
	FileRead      = 1u << 0,
	FileWrite     = 1u << 1,
	Network       = 1u << 2,
	Terminal      = 1u << 3,
	Process       = 1u << 4,
	Clipboard     = 1u << 5,
	Notifications = 1u << 6
};
Q_DECLARE_FLAGS(PluginPermissions, PluginPermission)

enum class RuntimeEnvironment : quint8 {
	Development,
	Production
};

// Per-plugin activation lifecycle:
// Inactive -> Activating -> Active -> Deactivating -> Inactive.
enum class ActivationState : quint8 {
	Inactive,
	Activating,
	Active,
	Deactivating
};

AICS_EXTENSIONSYSTEM_EXPORT const QList<PluginCapability>& allCapabilities();
AICS_EXTENSIONSYSTEM_EXPORT const QList<PluginPermission>& allPermissions();

AICS_EXTENSIONSYSTEM_EXPORT QString toString(PluginCapability capability);
AICS_EXTENSIONSYSTEM_EXPORT QString toString(PluginPermission permission);
AICS_EXTENSIONSYSTEM_EXPORT QString toString(RuntimeEnvironment environment);
AICS_EXTENSIONSYSTEM_EXPORT QString toString(ActivationState state);

AICS_EXTENSIONSYSTEM_EXPORT std::optional<PluginCapability> capabilityFromString(QStringView text);
AICS_EXTENSIONSYSTEM_EXPORT std::optional<PluginPermission> permissionFromString(QStringView text);
AICS_EXTENSIONSYSTEM_EXPORT std::optional<RuntimeEnvironment> environmentFromString(QStringView text);

// Flags in declaration order, as manifest strings.
AICS_EXTENSIONSYSTEM_EXPORT QStringList toStringList(PluginCapabilities capabilities);
AICS_EXTENSIONSYSTEM_EXPORT QStringList toStringList(PluginPermissions permissions);

// Values passed once to a plugin instance at initialization.
class AICS_EXTENSIONSYSTEM_EXPORT PluginContext final {
public:
	PluginContext(QString apiVersion, QString appVersion, RuntimeEnvironment environment)
		: m_apiVersion(std::move(apiVersion))
		, m_appVersion(std::move(appVersion))
		, m_environment(environment)
	{}

	const QString& apiVersion() const noexcept { return m_apiVersion; }
	const QString& appVersion() const noexcept { return m_appVersion; }
	RuntimeEnvironment environment() const noexcept { return m_environment; }

private:
	QString m_apiVersion;
	QString m_appVersion;
	RuntimeEnvironment m_environment;
};

} // namespace aics

Q_DECLARE_OPERATORS_FOR_FLAGS(aics::PluginCapabilities)
Q_DECLARE_OPERATORS_FOR_FLAGS(aics::PluginPermissions)
Q_DECLARE_METATYPE(aics::ActivationState)
