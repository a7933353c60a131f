// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/HostRequest.hpp"
#include "extensionsystem/PluginError.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <memory>

namespace aics {

// Backends behind the host API. All of them may be called from any thread.

class AICS_EXTENSIONSYSTEM_EXPORT IFileService
{
public:
	virtual ~IFileService() = default;

	virtual PluginError readFile(const QString& path, QByteArray& out) = 0;
	virtual PluginError writeFile(const QString& path, const QByteArray& contents) = 0;
};

class AICS_EXTENSIONSYSTEM_EXPORT ITerminalService
{
public:
	virtual ~ITerminalService() = default;

	virtual PluginError run(const RunTerminalRequest& request, ProcessOutput& out) = 0;
};

class AICS_EXTENSIONSYSTEM_EXPORT INetworkService
{
public:
	virtual ~INetworkService() = default;

	virtual PluginError send(const NetworkRequest& request, HttpReply& out) = 0;
};

class AICS_EXTENSIONSYSTEM_EXPORT IClipboardService
{
public:
	virtual ~IClipboardService() = default;

	virtual QString text() const = 0;
	virtual void setText(const QString& text) = 0;
};

class AICS_EXTENSIONSYSTEM_EXPORT INotificationService
{
public:
	virtual ~INotificationService() = default;

	virtual void post(const QString& pluginId, const NotificationRequest& request) = 0;
};

// Supplied by the embedding application.
class AICS_EXTENSIONSYSTEM_EXPORT IAiCompletionService
{
public:
	virtual ~IAiCompletionService() = default;

	virtual PluginError complete(const AiCompletionRequest& request, QString& out) = 0;
};

// Supplied by the embedding application.
class AICS_EXTENSIONSYSTEM_EXPORT IEditorService
{
public:
	virtual ~IEditorService() = default;

	virtual PluginError snapshot(EditorSnapshot& out) = 0;
	virtual PluginError insertText(const InsertTextRequest& request) = 0;
};

// The set of backends a HostApi dispatches to. Null members make the
// matching requests fail with ServiceUnavailable.
struct AICS_EXTENSIONSYSTEM_EXPORT HostServices {
	std::shared_ptr<IFileService> files;
	std::shared_ptr<ITerminalService> terminal;
	std::shared_ptr<INetworkService> network;
	std::shared_ptr<IClipboardService> clipboard;
	std::shared_ptr<INotificationService> notifications;
	std::shared_ptr<IAiCompletionService> ai;
	std::shared_ptr<IEditorService> editor;

	// Workspace files, processes, HTTP, an in-memory clipboard and a
	// NotificationCenter. AI completion and editor access stay empty.
	static HostServices createDefaults(const QString& workspaceRoot);
};

} // namespace aics
