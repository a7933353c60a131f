// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/HostServices.hpp"

#include <QtCore/QString>

namespace aics {

// Runs a program to completion with QProcess. Programs that outlive the
// request timeout are killed and reported as CommandFailed; a non-zero exit
// code is not an error.
class AICS_EXTENSIONSYSTEM_EXPORT ProcessTerminalService final : public ITerminalService
{
public:
	explicit ProcessTerminalService(QString defaultWorkingDirectory = {});

	PluginError run(const RunTerminalRequest& request, ProcessOutput& out) override;

private:
	QString m_defaultWorkingDirectory;
};

} // namespace aics
