// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginError.hpp"
#include "extensionsystem/PluginTypes.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QtPlugin>

#include <memory>

namespace aics {

class PluginHost;

struct PluginCommand {
	QString id;
	QJsonObject arguments;
};

// Outcome of PluginInstance::executeCommand. An empty result means no command
// ran (inactive plugin or unknown command).
struct PluginCommandResult {
	bool executed = false;
	PluginError error;
	QJsonObject output;

	bool isEmpty() const noexcept { return !executed; }
	bool ok() const noexcept { return executed && error.ok(); }

	static PluginCommandResult empty() { return {}; }

	static PluginCommandResult success(QJsonObject output = {})
	{
		PluginCommandResult r;
		r.executed = true;
		r.output = std::move(output);
		return r;
	}

	static PluginCommandResult failure(PluginError error)
	{
		PluginCommandResult r;
		r.executed = true;
		r.error = std::move(error);
		return r;
	}
};

// A menu or sidebar entry a plugin contributes; triggering it runs `commandId`.
struct PluginUiContribution {
	enum class Placement : quint8 {
		Menu,
		Sidebar
	};

	Placement placement = Placement::Menu;
	QString id;
	QString title;
	QString icon;
	QString commandId;
	QString shortcut; // menu items only

	bool operator==(const PluginUiContribution& other) const = default;
};

// The live, initialized form of a plugin. Implemented by plugin code and owned
// by the ActivationEngine. Hooks may run on a pool thread; an instance is only
// ever driven by one hook at a time.
class AICS_EXTENSIONSYSTEM_EXPORT PluginInstance
{
public:
	virtual ~PluginInstance() = default;

	// `host` stays valid until cleanup() returns. Calls made through it after
	// deactivation fail with NotFound.
	virtual PluginError initialize(const PluginContext& context, PluginHost& host) = 0;

	virtual void cleanup() = 0;

	virtual PluginCommandResult executeCommand(const PluginCommand& command) = 0;

	virtual QList<PluginUiContribution> uiContributions() const { return {}; }
};

// Root object interface of a plugin library's entry point.
class AICS_EXTENSIONSYSTEM_EXPORT IPluginFactory
{
public:
	virtual ~IPluginFactory() = default;

	virtual std::unique_ptr<PluginInstance> createInstance() = 0;
};

} // namespace aics

#define AICS_PLUGIN_FACTORY_IID "org.aics.PluginFactory/1.0"

Q_DECLARE_INTERFACE(aics::IPluginFactory, AICS_PLUGIN_FACTORY_IID)
