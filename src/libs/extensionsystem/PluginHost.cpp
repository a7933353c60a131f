// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginHost.hpp"

namespace aics {

PluginHost::PluginHost(std::shared_ptr<const HostApi> api, HostCaller caller)
    : m_api(std::move(api))
    , m_caller(std::move(caller))
{
}

HostResult PluginHost::request(const HostRequest& request) const
{
    if (isRevoked() || !m_api) {
        qCDebug(aicsHostApiLog) << "Rejected" << requestName(request) << "from inactive plugin" << m_caller.pluginId;
        return HostResult::failure(PluginError::notFound(
            QStringLiteral("Plugin %1 is no longer active.").arg(m_caller.pluginId)));
    }
    return m_api->dispatch(m_caller, request);
}

template <typename T>
PluginError PluginHost::requestValue(const HostRequest& hostRequest, T& out) const
{
    HostResult result = request(hostRequest);
    if (!result.ok())
        return result.error;
    if (const T* value = result.template get<T>()) {
        out = *value;
        return PluginError::none();
    }
    return PluginError::commandFailed(QStringLiteral("Host returned no value for %1.").arg(requestName(hostRequest)));
}

PluginError PluginHost::readFile(const QString& path, QByteArray& out) const
{
    return requestValue(ReadFileRequest{path}, out);
}

PluginError PluginHost::writeFile(const QString& path, const QByteArray& contents) const
{
    return request(WriteFileRequest{path, contents}).error;
}

PluginError PluginHost::runCommand(const QString& program, const QStringList& arguments, ProcessOutput& out,
                                   const QString& workingDirectory, int timeoutMs) const
{
    return requestValue(RunTerminalRequest{program, arguments, workingDirectory, timeoutMs}, out);
}

PluginError PluginHost::httpRequest(const NetworkRequest& networkRequest, HttpReply& out) const
{
    return requestValue(networkRequest, out);
}

PluginError PluginHost::clipboardText(QString& out) const
{
    return requestValue(ReadClipboardRequest{}, out);
}

PluginError PluginHost::setClipboardText(const QString& text) const
{
    return request(WriteClipboardRequest{text}).error;
}

PluginError PluginHost::notify(const QString& title, const QString& message, NotificationLevel level) const
{
    return request(NotificationRequest{title, message, level}).error;
}

PluginError PluginHost::requestCompletion(const QString& prompt, QString& out) const
{
    AiCompletionRequest completion;
    completion.prompt = prompt;
    return requestValue(completion, out);
}

PluginError PluginHost::editorSnapshot(EditorSnapshot& out) const
{
    return requestValue(EditorSnapshotRequest{}, out);
}

PluginError PluginHost::insertText(const QString& text, int offset) const
{
    return request(InsertTextRequest{text, offset}).error;
}

} // namespace aics
