// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <extensionsystem/PluginInstance.hpp>

#include <QtCore/QObject>

namespace aics::plugins::formatter {

// Whitespace formatter. Commands:
//   format.text                  { "text": "..." }  -> { "text": "..." }
//   format.trimTrailingWhitespace { "path": "..." } -> { "changedLines": n }
class FormatterInstance final : public PluginInstance
{
public:
	PluginError initialize(const PluginContext& context, PluginHost& host) override;
	void cleanup() override;
	PluginCommandResult executeCommand(const PluginCommand& command) override;
	QList<PluginUiContribution> uiContributions() const override;

	// Strips trailing blanks from every line and ends the text with exactly
	// one newline. `changedLines` counts lines that lost whitespace.
	static QString formatText(const QString& text, int* changedLines = nullptr);

private:
	PluginCommandResult formatFile(const QString& path);

	PluginHost* m_host = nullptr;
};

class ExampleFormatterPlugin final : public QObject, public IPluginFactory
{
	Q_OBJECT
	Q_PLUGIN_METADATA(IID AICS_PLUGIN_FACTORY_IID)
	Q_INTERFACES(aics::IPluginFactory)

public:
	std::unique_ptr<PluginInstance> createInstance() override;
};

} // namespace aics::plugins::formatter
