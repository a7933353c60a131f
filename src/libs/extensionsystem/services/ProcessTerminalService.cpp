// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/services/ProcessTerminalService.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QProcess>

namespace aics {

ProcessTerminalService::ProcessTerminalService(QString defaultWorkingDirectory)
    : m_defaultWorkingDirectory(std::move(defaultWorkingDirectory))
{
}

PluginError ProcessTerminalService::run(const RunTerminalRequest& request, ProcessOutput& out)
{
    const QString workingDirectory =
        request.workingDirectory.isEmpty() ? m_defaultWorkingDirectory : request.workingDirectory;
    if (!workingDirectory.isEmpty() && !QFileInfo(workingDirectory).isDir()) {
        return PluginError::invalidRequest(QStringLiteral("Working directory %1 does not exist.")
                                               .arg(workingDirectory));
    }

    QProcess process;
    if (!workingDirectory.isEmpty())
        process.setWorkingDirectory(workingDirectory);

    process.start(request.program, request.arguments);
    if (!process.waitForStarted()) {
        return PluginError::commandFailed(QStringLiteral("Failed to start %1: %2")
                                              .arg(request.program, process.errorString()));
    }

    if (!process.waitForFinished(request.timeoutMs)) {
        process.kill();
        process.waitForFinished();
        return PluginError::commandFailed(QStringLiteral("%1 did not finish within %2 ms.")
                                              .arg(request.program)
                                              .arg(request.timeoutMs));
    }

    if (process.exitStatus() == QProcess::CrashExit)
        return PluginError::commandFailed(QStringLiteral("%1 crashed.").arg(request.program));

    out.exitCode = process.exitCode();
    out.standardOutput = process.readAllStandardOutput();
    out.standardError = process.readAllStandardError();
    return PluginError::none();
}

} // namespace aics
