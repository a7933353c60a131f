// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ExampleFormatterPlugin.hpp"

#include <extensionsystem/PluginHost.hpp>

#include <QtCore/QStringList>

namespace aics::plugins::formatter {

namespace {

using namespace Qt::StringLiterals;

const QString kFormatText = u"format.text"_s;
const QString kTrimFile = u"format.trimTrailingWhitespace"_s;

} // namespace

PluginError FormatterInstance::initialize(const PluginContext& context, PluginHost& host)
{
    m_host = &host;
    if (context.environment() == RuntimeEnvironment::Development) {
        const PluginError notified = host.notify(u"Formatter"_s,
                                                 QStringLiteral("Formatter ready (host API %1).").arg(context.apiVersion()));
        if (!notified.ok())
            return notified;
    }
    return PluginError::none();
}

void FormatterInstance::cleanup()
{
    m_host = nullptr;
}

QString FormatterInstance::formatText(const QString& text, int* changedLines)
{
    QStringList lines = text.split(u'\n');
    int changed = 0;
    for (QString& line : lines) {
        qsizetype end = line.size();
        while (end > 0 && (line.at(end - 1) == u' ' || line.at(end - 1) == u'\t' || line.at(end - 1) == u'\r'))
            --end;
        if (end != line.size()) {
            line.truncate(end);
            ++changed;
        }
    }
    while (!lines.isEmpty() && lines.back().isEmpty())
        lines.removeLast();

    if (changedLines)
        *changedLines = changed;
    return lines.isEmpty() ? QString() : lines.join(u'\n') + u'\n';
}

PluginCommandResult FormatterInstance::formatFile(const QString& path)
{
    if (!m_host)
        return PluginCommandResult::failure(PluginError::commandFailed(u"Formatter is not initialized."_s));

    QByteArray contents;
    if (PluginError err = m_host->readFile(path, contents); !err.ok())
        return PluginCommandResult::failure(std::move(err));

    int changed = 0;
    const QString original = QString::fromUtf8(contents);
    const QString formatted = formatText(original, &changed);
    if (formatted != original) {
        if (PluginError err = m_host->writeFile(path, formatted.toUtf8()); !err.ok())
            return PluginCommandResult::failure(std::move(err));
    }

    QJsonObject output;
    output.insert(u"changedLines"_s, changed);
    return PluginCommandResult::success(output);
}

PluginCommandResult FormatterInstance::executeCommand(const PluginCommand& command)
{
    if (command.id == kFormatText) {
        QJsonObject output;
        output.insert(u"text"_s, formatText(command.arguments.value(u"text"_s).toString()));
        return PluginCommandResult::success(output);
    }
    if (command.id == kTrimFile) {
        const QString path = command.arguments.value(u"path"_s).toString();
        if (path.isEmpty())
            return PluginCommandResult::failure(PluginError::invalidRequest(u"Missing 'path' argument."_s));
        return formatFile(path);
    }
    return PluginCommandResult::empty();
}

QList<PluginUiContribution> FormatterInstance::uiContributions() const
{
    PluginUiContribution menu;
    menu.placement = PluginUiContribution::Placement::Menu;
    menu.id = u"formatter.menu.trim"_s;
    menu.title = u"Trim Trailing Whitespace"_s;
    menu.commandId = kTrimFile;
    menu.shortcut = u"Ctrl+Alt+W"_s;

    return {menu};
}

std::unique_ptr<PluginInstance> ExampleFormatterPlugin::createInstance()
{
    return std::make_unique<FormatterInstance>();
}

} // namespace aics::plugins::formatter
