// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/PluginManifest.hpp"

#include <QtCore/QList>
#include <QtCore/QString>

namespace aics {

// A parsed manifest bound to the bundle directory it was read from.
struct Plugin {
	PluginManifest manifest;
	QString bundlePath; // absolute

	const QString& id() const noexcept { return manifest.id; }
	bool isValid() const noexcept { return !manifest.id.isEmpty() && !bundlePath.isEmpty(); }

	bool operator==(const Plugin& other) const = default;
};

using PluginList = QList<Plugin>;

} // namespace aics
