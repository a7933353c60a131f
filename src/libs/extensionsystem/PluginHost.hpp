// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/HostApi.hpp"
#include "extensionsystem/HostRequest.hpp"
#include "extensionsystem/PluginError.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <atomic>
#include <memory>

namespace aics {

// A plugin's handle on the host API, handed to PluginInstance::initialize().
// Every call is dispatched with the plugin's own id and permissions. Once the
// plugin is deactivated the handle is revoked and every call fails with
// NotFound.
class AICS_EXTENSIONSYSTEM_EXPORT PluginHost final
{
public:
	PluginHost(std::shared_ptr<const HostApi> api, HostCaller caller);

	PluginHost(const PluginHost&) = delete;
	PluginHost& operator=(const PluginHost&) = delete;

	const QString& pluginId() const noexcept { return m_caller.pluginId; }
	PluginPermissions permissions() const noexcept { return m_caller.permissions; }

	bool isRevoked() const noexcept { return m_revoked.load(std::memory_order_acquire); }
	void revoke() noexcept { m_revoked.store(true, std::memory_order_release); }

	HostResult request(const HostRequest& request) const;

	PluginError readFile(const QString& path, QByteArray& out) const;
	PluginError writeFile(const QString& path, const QByteArray& contents) const;
	PluginError runCommand(const QString& program, const QStringList& arguments, ProcessOutput& out,
	                       const QString& workingDirectory = {}, int timeoutMs = 30000) const;
	PluginError httpRequest(const NetworkRequest& request, HttpReply& out) const;
	PluginError clipboardText(QString& out) const;
	PluginError setClipboardText(const QString& text) const;
	PluginError notify(const QString& title, const QString& message,
	                   NotificationLevel level = NotificationLevel::Info) const;
	PluginError requestCompletion(const QString& prompt, QString& out) const;
	PluginError editorSnapshot(EditorSnapshot& out) const;
	PluginError insertText(const QString& text, int offset = -1) const;

private:
	template <typename T>
	PluginError requestValue(const HostRequest& request, T& out) const;

	std::shared_ptr<const HostApi> m_api;
	const HostCaller m_caller;
	std::atomic_bool m_revoked{false};
};

} // namespace aics
