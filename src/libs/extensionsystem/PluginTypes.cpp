// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginTypes.hpp"

namespace aics {

const QList<PluginCapability>& allCapabilities()
{
    static const QList<PluginCapability> all{
        PluginCapability::Commands,
        PluginCapability::Ui,
        PluginCapability::LanguageSupport,
        PluginCapability::Theme,
        PluginCapability::Snippets,
        PluginCapability::Linter,
        PluginCapability::Formatter,
        PluginCapability::Debugger,
        PluginCapability::Terminal,
        PluginCapability::FileSystem,
        PluginCapability::Network,
        PluginCapability::Ai,
    };
    return all;
}

const QList<PluginPermission>& allPermissions()
{
    static const QList<PluginPermission> all{
        PluginPermission::FileRead,
        PluginPermission::FileWrite,
        PluginPermission::Network,
        PluginPermission::Terminal,
        PluginPermission::Process,
        PluginPermission::Clipboard,
        PluginPermission::Notifications,
    };
    return all;
}

QString toString(PluginCapability capability)
{
    switch (capability) {
    case PluginCapability::Commands: return QStringLiteral("commands");
    case PluginCapability::Ui: return QStringLiteral("ui");
    case PluginCapability::LanguageSupport: return QStringLiteral("languageSupport");
    case PluginCapability::Theme: return QStringLiteral("theme");
    case PluginCapability::Snippets: return QStringLiteral("snippets");
    case PluginCapability::Linter: return QStringLiteral("linter");
    case PluginCapability::Formatter: return QStringLiteral("formatter");
    case PluginCapability::Debugger: return QStringLiteral("debugger");
    case PluginCapability::Terminal: return QStringLiteral("terminal");
    case PluginCapability::FileSystem: return QStringLiteral("fileSystem");
    case PluginCapability::Network: return QStringLiteral("network");
    case PluginCapability::Ai: return QStringLiteral("ai");
    }
    return {};
}

QString toString(PluginPermission permission)
{
    switch (permission) {
    case PluginPermission::FileRead: return QStringLiteral("fileRead");
    case PluginPermission::FileWrite: return QStringLiteral("fileWrite");
    case PluginPermission::Network: return QStringLiteral("network");
    case PluginPermission::Terminal: return QStringLiteral("terminal");
    case PluginPermission::Process: return QStringLiteral("process");
    case PluginPermission::Clipboard: return QStringLiteral("clipboard");
    case PluginPermission::Notifications: return QStringLiteral("notifications");
    }
    return {};
}

QString toString(RuntimeEnvironment environment)
{
    switch (environment) {
    case RuntimeEnvironment::Development: return QStringLiteral("development");
    case RuntimeEnvironment::Production: return QStringLiteral("production");
    }
    return {};
}

QString toString(ActivationState state)
{
    switch (state) {
    case ActivationState::Inactive: return QStringLiteral("Inactive");
    case ActivationState::Activating: return QStringLiteral("Activating");
    case ActivationState::Active: return QStringLiteral("Active");
    case ActivationState::Deactivating: return QStringLiteral("Deactivating");
    }
    return {};
}

// Manifest strings are matched exactly; "FileRead" is not "fileRead".
std::optional<PluginCapability> capabilityFromString(QStringView text)
{
    for (PluginCapability c : allCapabilities()) {
        if (text == toString(c))
            return c;
    }
    return std::nullopt;
}

std::optional<PluginPermission> permissionFromString(QStringView text)
{
    for (PluginPermission p : allPermissions()) {
        if (text == toString(p))
            return p;
    }
    return std::nullopt;
}

std::optional<RuntimeEnvironment> environmentFromString(QStringView text)
{
    if (text.compare(QLatin1String("development"), Qt::CaseInsensitive) == 0)
        return RuntimeEnvironment::Development;
    if (text.compare(QLatin1String("production"), Qt::CaseInsensitive) == 0)
        return RuntimeEnvironment::Production;
    return std::nullopt;
}

QStringList toStringList(PluginCapabilities capabilities)
{
    QStringList out;
    for (PluginCapability c : allCapabilities()) {
        if (capabilities.testFlag(c))
            out.push_back(toString(c));
    }
    return out;
}

QStringList toStringList(PluginPermissions permissions)
{
    QStringList out;
    for (PluginPermission p : allPermissions()) {
        if (permissions.testFlag(p))
            out.push_back(toString(p));
    }
    return out;
}

} // namespace aics
