/*
 *  This file is part of channelget.
 *
 *  Copyright (C) 2007-2019 Andrey Prygunkov <hugbug@users.sourceforge.net>
 *  Copyright (C) 2026 channelget contributors
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#ifndef PROCESS_H
#define PROCESS_H

#include "NString.h"
#include "Thread.h"
#include "Log.h"

/*
Runs an external program and forwards its stdout/stderr line by line to
"ProcessOutput". Derived classes override "ProcessOutput" to interpret
the output of the particular tool.
 */
class ProcessController
{
public:
	typedef std::vector<CString> ArgList;

	static const int FORK_ERROR_EXIT_CODE = 254;

	virtual ~ProcessController() {}
	int Execute();

	const char* GetProgram() { return !m_args.empty() ? *m_args[0] : nullptr; }
	void SetWorkingDir(const char* workingDir) { m_workingDir = workingDir; }
	void SetArgs(ArgList&& args) { m_args = std::move(args); }
	ArgList& GetArgs() { return m_args; }
	void SetInfoName(const char* infoName) { m_infoName = infoName; }
	void SetLogPrefix(const char* logPrefix) { m_logPrefix = logPrefix; }
	bool GetStartError() { return m_startError; }

protected:
	virtual void ProcessOutput(char* text);
	virtual bool ReadLine(char* buf, int bufSize, FILE* stream);
	void PrintMessage(Message::EKind kind, const char* format, ...) PRINTF_SYNTAX(3);
	virtual void AddMessage(Message::EKind kind, const char* text);
	bool StartProcess(int* pipein);
	int WaitProcess();

private:
	ArgList m_args;
	CString m_workingDir;
	CString m_infoName;
	CString m_logPrefix;
	bool m_startError = false;
	pid_t m_processId = 0;
};

#endif
