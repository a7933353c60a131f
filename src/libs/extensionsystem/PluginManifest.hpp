// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginError.hpp"
#include "extensionsystem/PluginTypes.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVersionNumber>

namespace aics {

// Identity, capabilities and permissions of one plugin, as declared by the
// bundle's manifest.json. Parsing is all-or-nothing: a manifest that fails
// any check is never partially filled in.
struct AICS_EXTENSIONSYSTEM_EXPORT PluginManifest {
	QString id;
	QString name;
	QString version;
	QString author;
	QString description;
	QString icon;     // optional
	QString homepage; // optional

	PluginCapabilities capabilities;
	PluginPermissions permissions;
	QStringList dependencies; // optional, plugin ids

	QString entryPoint; // bundle-relative
	QString minimumAppVersion;

	static PluginError parse(const QByteArray& bytes, PluginManifest& out);
	static PluginError fromJson(const QJsonObject& object, PluginManifest& out);

	QJsonObject toJson() const;
	QByteArray serialize() const;

	QVersionNumber versionNumber() const;
	QVersionNumber minimumAppVersionNumber() const;

	// True when this plugin needs a newer host than `hostVersion`.
	bool requiresNewerHost(const QVersionNumber& hostVersion) const;

	static bool isValidId(QStringView id);

	// "1.2", "1.2.3", "1.2.3-beta.1" and "1.2.3+build" are accepted.
	static bool isValidVersion(QStringView version);

	bool operator==(const PluginManifest& other) const = default;
};

} // namespace aics
