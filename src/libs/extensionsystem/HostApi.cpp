// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/HostApi.hpp"

#include <QtCore/QSet>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const QSet<QByteArray>& allowedMethods()
{
    static const QSet<QByteArray> methods = {"GET", "HEAD", "POST", "PUT", "PATCH", "DELETE"};
    return methods;
}

PluginError missingService(const char* what)
{
    return PluginError::unavailable(QStringLiteral("No %1 service is configured.").arg(QLatin1StringView(what)));
}

} // namespace

QString hostApiVersion()
{
    return u"1.0.0"_s;
}

QString toString(NotificationLevel level)
{
    switch (level) {
    case NotificationLevel::Info: return u"info"_s;
    case NotificationLevel::Success: return u"success"_s;
    case NotificationLevel::Warning: return u"warning"_s;
    case NotificationLevel::Error: return u"error"_s;
    }
    return {};
}

QString requestName(const HostRequest& request)
{
    return std::visit(Overloaded{
        [](const ReadFileRequest&) { return u"readFile"_s; },
        [](const WriteFileRequest&) { return u"writeFile"_s; },
        [](const RunTerminalRequest&) { return u"runTerminal"_s; },
        [](const NetworkRequest&) { return u"network"_s; },
        [](const ReadClipboardRequest&) { return u"readClipboard"_s; },
        [](const WriteClipboardRequest&) { return u"writeClipboard"_s; },
        [](const NotificationRequest&) { return u"notify"_s; },
        [](const AiCompletionRequest&) { return u"aiCompletion"_s; },
        [](const EditorSnapshotRequest&) { return u"editorSnapshot"_s; },
        [](const InsertTextRequest&) { return u"insertText"_s; },
    }, request);
}

HostApi::HostApi(HostServices services)
    : m_services(std::move(services))
{
}

PluginPermissions HostApi::requiredPermissions(const HostRequest& request)
{
    return std::visit(Overloaded{
        [](const ReadFileRequest&) { return PluginPermissions(PluginPermission::FileRead); },
        [](const WriteFileRequest&) { return PluginPermissions(PluginPermission::FileWrite); },
        [](const RunTerminalRequest&) { return PluginPermission::Terminal | PluginPermission::Process; },
        [](const NetworkRequest&) { return PluginPermissions(PluginPermission::Network); },
        [](const ReadClipboardRequest&) { return PluginPermissions(PluginPermission::Clipboard); },
        [](const WriteClipboardRequest&) { return PluginPermissions(PluginPermission::Clipboard); },
        [](const NotificationRequest&) { return PluginPermissions(PluginPermission::Notifications); },
        [](const AiCompletionRequest&) { return PluginPermissions(PluginPermission::Network); },
        [](const EditorSnapshotRequest&) { return PluginPermissions(PluginPermission::FileRead); },
        [](const InsertTextRequest&) { return PluginPermissions(PluginPermission::FileWrite); },
    }, request);
}

QString HostApi::validate(const HostRequest& request)
{
    return std::visit(Overloaded{
        [](const ReadFileRequest& r) {
            return r.path.trimmed().isEmpty() ? u"File path is empty."_s : QString();
        },
        [](const WriteFileRequest& r) {
            return r.path.trimmed().isEmpty() ? u"File path is empty."_s : QString();
        },
        [](const RunTerminalRequest& r) {
            if (r.program.trimmed().isEmpty())
                return u"Program is empty."_s;
            if (r.timeoutMs <= 0)
                return u"Timeout must be positive."_s;
            return QString();
        },
        [](const NetworkRequest& r) {
            const QString scheme = r.url.scheme().toLower();
            if (!r.url.isValid() || r.url.host().isEmpty() || (scheme != u"http"_s && scheme != u"https"_s))
                return QStringLiteral("'%1' is not an http(s) URL.").arg(r.url.toString());
            if (!allowedMethods().contains(r.method.toUpper()))
                return QStringLiteral("Unsupported HTTP method '%1'.").arg(QString::fromLatin1(r.method));
            if (r.timeoutMs <= 0)
                return u"Timeout must be positive."_s;
            return QString();
        },
        [](const ReadClipboardRequest&) { return QString(); },
        [](const WriteClipboardRequest&) { return QString(); },
        [](const NotificationRequest& r) {
            return r.message.trimmed().isEmpty() ? u"Notification message is empty."_s : QString();
        },
        [](const AiCompletionRequest& r) {
            if (r.prompt.trimmed().isEmpty())
                return u"Prompt is empty."_s;
            if (r.maxTokens <= 0)
                return u"maxTokens must be positive."_s;
            return QString();
        },
        [](const EditorSnapshotRequest&) { return QString(); },
        [](const InsertTextRequest& r) {
            if (r.text.isEmpty())
                return u"Text to insert is empty."_s;
            if (r.offset < -1)
                return u"Insert offset is negative."_s;
            return QString();
        },
    }, request);
}

HostResult HostApi::dispatch(const HostCaller& caller, const HostRequest& request) const
{
    const PluginPermissions required = requiredPermissions(request);
    const PluginPermissions missing = required & ~caller.permissions;
    if (missing.toInt() != 0) {
        const QString names = toStringList(missing).join(u", "_s);
        qCWarning(aicsHostApiLog) << "Denied" << requestName(request) << "for" << caller.pluginId
                                  << "- missing permission(s)" << names;
        return HostResult::failure(PluginError::missingPermission(
            QStringLiteral("Plugin %1 lacks permission(s) %2 required for %3.")
                .arg(caller.pluginId, names, requestName(request))));
    }

    if (const QString problem = validate(request); !problem.isEmpty()) {
        qCDebug(aicsHostApiLog) << "Rejected" << requestName(request) << "from" << caller.pluginId << "-" << problem;
        return HostResult::failure(PluginError::invalidRequest(problem));
    }

    qCDebug(aicsHostApiLog) << caller.pluginId << "->" << requestName(request);
    return execute(caller, request);
}

HostResult HostApi::execute(const HostCaller& caller, const HostRequest& request) const
{
    return std::visit(Overloaded{
        [this](const ReadFileRequest& r) {
            if (!m_services.files)
                return HostResult::failure(missingService("file"));
            QByteArray contents;
            PluginError err = m_services.files->readFile(r.path, contents);
            return err.ok() ? HostResult::success(std::move(contents)) : HostResult::failure(std::move(err));
        },
        [this](const WriteFileRequest& r) {
            if (!m_services.files)
                return HostResult::failure(missingService("file"));
            PluginError err = m_services.files->writeFile(r.path, r.contents);
            return err.ok() ? HostResult::success() : HostResult::failure(std::move(err));
        },
        [this](const RunTerminalRequest& r) {
            if (!m_services.terminal)
                return HostResult::failure(missingService("terminal"));
            ProcessOutput output;
            PluginError err = m_services.terminal->run(r, output);
            return err.ok() ? HostResult::success(std::move(output)) : HostResult::failure(std::move(err));
        },
        [this](const NetworkRequest& r) {
            if (!m_services.network)
                return HostResult::failure(missingService("network"));
            HttpReply reply;
            PluginError err = m_services.network->send(r, reply);
            return err.ok() ? HostResult::success(std::move(reply)) : HostResult::failure(std::move(err));
        },
        [this](const ReadClipboardRequest&) {
            if (!m_services.clipboard)
                return HostResult::failure(missingService("clipboard"));
            return HostResult::success(m_services.clipboard->text());
        },
        [this](const WriteClipboardRequest& r) {
            if (!m_services.clipboard)
                return HostResult::failure(missingService("clipboard"));
            m_services.clipboard->setText(r.text);
            return HostResult::success();
        },
        [this, &caller](const NotificationRequest& r) {
            if (!m_services.notifications)
                return HostResult::failure(missingService("notification"));
            m_services.notifications->post(caller.pluginId, r);
            return HostResult::success();
        },
        [this](const AiCompletionRequest& r) {
            if (!m_services.ai)
                return HostResult::failure(missingService("AI completion"));
            QString completion;
            PluginError err = m_services.ai->complete(r, completion);
            return err.ok() ? HostResult::success(std::move(completion)) : HostResult::failure(std::move(err));
        },
        [this](const EditorSnapshotRequest&) {
            if (!m_services.editor)
                return HostResult::failure(missingService("editor"));
            EditorSnapshot snapshot;
            PluginError err = m_services.editor->snapshot(snapshot);
            return err.ok() ? HostResult::success(std::move(snapshot)) : HostResult::failure(std::move(err));
        },
        [this](const InsertTextRequest& r) {
            if (!m_services.editor)
                return HostResult::failure(missingService("editor"));
            PluginError err = m_services.editor->insertText(r);
            return err.ok() ? HostResult::success() : HostResult::failure(std::move(err));
        },
    }, request);
}

} // namespace aics
