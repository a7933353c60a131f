// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginError.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>

#include <variant>

namespace aics {

// Requests a plugin can make of the host, API version 1.0.0. The set is
// closed; every request names the permissions it needs in HostApi.

struct ReadFileRequest {
	QString path; // workspace-relative or absolute inside the workspace
};

struct WriteFileRequest {
	QString path;
	QByteArray contents;
};

struct RunTerminalRequest {
	QString program;
	QStringList arguments;
	QString workingDirectory; // empty: workspace root
	int timeoutMs = 30000;
};

struct NetworkRequest {
	QByteArray method = "GET";
	QUrl url;
	QHash<QByteArray, QByteArray> headers;
	QByteArray body;
	int timeoutMs = 30000;
};

struct ReadClipboardRequest {};

struct WriteClipboardRequest {
	QString text;
};

enum class NotificationLevel : quint8 {
	Info,
	Success,
	Warning,
	Error
};

struct NotificationRequest {
	QString title;
	QString message;
	NotificationLevel level = NotificationLevel::Info;
};

struct AiCompletionRequest {
	QString prompt;
	QString model; // empty: service default
	int maxTokens = 256;
};

struct EditorSnapshotRequest {};

struct InsertTextRequest {
	QString text;
	int offset = -1; // -1: at the cursor
};

using HostRequest = std::variant<ReadFileRequest,
                                 WriteFileRequest,
                                 RunTerminalRequest,
                                 NetworkRequest,
                                 ReadClipboardRequest,
                                 WriteClipboardRequest,
                                 NotificationRequest,
                                 AiCompletionRequest,
                                 EditorSnapshotRequest,
                                 InsertTextRequest>;

struct ProcessOutput {
	int exitCode = 0;
	QByteArray standardOutput;
	QByteArray standardError;
};

struct HttpReply {
	int statusCode = 0;
	QHash<QByteArray, QByteArray> headers;
	QByteArray body;
};

struct EditorSnapshot {
	QString documentPath;
	QString languageId;
	QString text;
	int cursorOffset = 0;
};

struct Notification {
	QString pluginId;
	QString title;
	QString message;
	NotificationLevel level = NotificationLevel::Info;
	QDateTime postedAt;
};

// Outcome of a host request. `payload` holds the value the request kind
// produces (file contents, process output, ...) when `error` is ok.
struct HostResult {
	using Payload = std::variant<std::monostate, QByteArray, QString, ProcessOutput, HttpReply, EditorSnapshot>;

	PluginError error;
	Payload payload;

	bool ok() const noexcept { return error.ok(); }

	template <typename T>
	const T* get() const noexcept { return std::get_if<T>(&payload); }

	static HostResult failure(PluginError error) { return HostResult{std::move(error), {}}; }
	static HostResult success(Payload payload = {}) { return HostResult{PluginError::none(), std::move(payload)}; }
};

AICS_EXTENSIONSYSTEM_EXPORT QString hostApiVersion();
AICS_EXTENSIONSYSTEM_EXPORT QString toString(NotificationLevel level);

// Short name of the request kind, for logs ("readFile", "runTerminal", ...).
AICS_EXTENSIONSYSTEM_EXPORT QString requestName(const HostRequest& request);

} // namespace aics
