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


#include "channelget.h"
#include "Process.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

#ifdef CHILD_WATCHDOG
/**
 * A forked child process occasionally hangs directly after the start,
 * forking in a multithreaded application is not fully reliable.
 *
 * Workaround:
 * 1) child process prints a line into stdout directly after the start;
 * 2) parent process waits for a line for 60 seconds. If it didn't receive it
 *    the child process is assumed to be hanging and will be killed. Another attempt
 *    will be made.
 */
class ChildWatchDog : public Thread
{
public:
	void SetProcessId(pid_t processId) { m_processId = processId; }
	void SetInfoName(const char* infoName) { m_infoName = infoName; }
	void Stop() override;

protected:
	void Run() override;

private:
	pid_t m_processId;
	CString m_infoName;
	Mutex m_waitMutex;
	ConditionVar m_waitCond;
};

void ChildWatchDog::Run()
{
	static const int WAIT_SECONDS = 60;

	bool stopped;
	{
		Guard guard(m_waitMutex);
		stopped = m_waitCond.WaitFor(m_waitMutex, WAIT_SECONDS * 1000, [&]{ return IsStopped(); });
	}

	if (!stopped)
	{
		info("Restarting hanging child process for %s", *m_infoName);
		kill(m_processId, SIGKILL);
	}
}

void ChildWatchDog::Stop()
{
	Guard guard(m_waitMutex);
	Thread::Stop();
	m_waitCond.NotifyAll();
}
#endif

int ProcessController::Execute()
{
	int exitCode = 0;
	m_startError = false;

#ifdef CHILD_WATCHDOG
	bool childConfirmed = false;
	while (!childConfirmed)
	{
#endif

	int pipein = -1;
	if (!StartProcess(&pipein))
	{
		m_startError = true;
		return -1;
	}

	// open the read end
	FILE* readpipe = fdopen(pipein, "r");
	if (!readpipe)
	{
		PrintMessage(Message::mkError, "Could not open read pipe to %s", *m_infoName);
		close(pipein);
		WaitProcess();
		m_startError = true;
		return -1;
	}

#ifdef CHILD_WATCHDOG
	debug("Creating child watchdog");
	ChildWatchDog watchDog;
	watchDog.SetAutoDestroy(false);
	watchDog.SetProcessId(m_processId);
	watchDog.SetInfoName(m_infoName);
	watchDog.Start();
#endif

	CharBuffer buf(1024 * 10);

	debug("Entering pipe-loop");
	bool firstLine = true;
	while (!feof(readpipe))
	{
		if (ReadLine(buf, buf.Size(), readpipe))
		{
#ifdef CHILD_WATCHDOG
			if (!childConfirmed)
			{
				childConfirmed = true;
				watchDog.Stop();
				debug("Child confirmed");
				continue;
			}
#endif
			if (firstLine && !strncmp(buf, "[ERROR] Could not start ", 24))
			{
				m_startError = true;
			}
			ProcessOutput(buf);
			firstLine = false;
		}
	}
	debug("Exited pipe-loop");

#ifdef CHILD_WATCHDOG
	if (!childConfirmed)
	{
		watchDog.Stop();
	}
	while (watchDog.IsRunning())
	{
		Util::Sleep(5);
	}
#endif

	fclose(readpipe);

	exitCode = WaitProcess();
	if (exitCode == FORK_ERROR_EXIT_CODE && m_startError)
	{
		exitCode = -1;
	}

#ifdef CHILD_WATCHDOG
	}	// while (!childConfirmed)
#endif

	debug("Exit code %i", exitCode);
	return exitCode;
}

bool ProcessController::StartProcess(int* pipein)
{
	CString workingDir = *m_workingDir;
	if (workingDir.Empty())
	{
		workingDir = FileSystem::GetCurrentDirectory();
	}

	const char* program = m_args[0];

	int pin[] = {0, 0};

	// create the pipe
	if (pipe(pin))
	{
		PrintMessage(Message::mkError, "Could not open read pipe: errno %i", errno);
		return false;
	}

	std::vector<char*> args;
	std::copy(m_args.begin(), m_args.end(), std::back_inserter(args));
	args.emplace_back(nullptr);
	char* const* argdata = (char* const*)args.data();

#ifdef DEBUG
	debug("Starting process: %s", program);
	for (const char* arg : m_args)
	{
		debug("arg: %s", arg);
	}
#endif

	debug("forking");
	pid_t pid = fork();

	if (pid == -1)
	{
		PrintMessage(Message::mkError, "Could not start %s: errno %i", *m_infoName, errno);
		close(pin[0]);
		close(pin[1]);
		return false;
	}
	else if (pid == 0)
	{
		// here goes the second instance

		// only async-signal-safe functions may be used here or the program may hang.

		// new process group, the child does not receive the terminal's SIGINT:
		// running downloads complete even when shutdown is requested
		setsid();

		// make the pipeout to be the same as stdout and stderr
		dup2(pin[1], 1);
		dup2(pin[1], 2);

		close(pin[0]);
		close(pin[1]);

#ifdef CHILD_WATCHDOG
		if (write(1, "\n", 1) < 0)
		{
			_exit(FORK_ERROR_EXIT_CODE);
		}
#endif

		if (chdir(workingDir) == -1)
		{
			fprintf(stdout, "[ERROR] Could not change working directory for %s: %s\n", program, strerror(errno));
			fflush(stdout);
			_exit(FORK_ERROR_EXIT_CODE);
		}

		execvp(program, argdata);

		// NOTE: the text "[ERROR] Could not start " is checked in "Execute",
		// if changed, adjust the dependent code there.
		fprintf(stdout, "[ERROR] Could not start %s: %s\n", program, strerror(errno));
		fflush(stdout);
		_exit(FORK_ERROR_EXIT_CODE);
	}

	// continue the first instance
	debug("forked");
	debug("Child Process-ID: %i", (int)pid);

	m_processId = pid;

	// close unused pipe end
	close(pin[1]);

	*pipein = pin[0];
	return true;
}

int ProcessController::WaitProcess()
{
	int status = 0;
	while (waitpid(m_processId, &status, 0) == -1 && errno == EINTR) ;
	m_processId = 0;
	if (WIFEXITED(status))
	{
		return WEXITSTATUS(status);
	}
	return -1;
}

bool ProcessController::ReadLine(char* buf, int bufSize, FILE* stream)
{
	return fgets(buf, bufSize, stream);
}

void ProcessController::ProcessOutput(char* text)
{
	for (char* pend = text + strlen(text) - 1; pend >= text && (*pend == '\n' || *pend == '\r' || *pend == ' '); pend--) *pend = '\0';

	if (text[0] == '\0')
	{
		// skip empty lines
		return;
	}

	if (!strncmp(text, "[INFO] ", 7))
	{
		PrintMessage(Message::mkInfo, "%s", text + 7);
	}
	else if (!strncmp(text, "[WARNING] ", 10))
	{
		PrintMessage(Message::mkWarning, "%s", text + 10);
	}
	else if (!strncmp(text, "[ERROR] ", 8))
	{
		PrintMessage(Message::mkError, "%s", text + 8);
	}
	else if (!strncmp(text, "[DETAIL] ", 9))
	{
		PrintMessage(Message::mkDetail, "%s", text + 9);
	}
	else if (!strncmp(text, "[DEBUG] ", 8))
	{
		PrintMessage(Message::mkDebug, "%s", text + 8);
	}
	else
	{
		PrintMessage(Message::mkDetail, "%s", text);
	}
}

void ProcessController::AddMessage(Message::EKind kind, const char* text)
{
	switch (kind)
	{
		case Message::mkDetail:
			detail("%s", text);
			break;

		case Message::mkInfo:
			info("%s", text);
			break;

		case Message::mkWarning:
			warn("%s", text);
			break;

		case Message::mkError:
			error("%s", text);
			break;

		case Message::mkDebug:
			debug("%s", text);
			break;
	}
}

void ProcessController::PrintMessage(Message::EKind kind, const char* format, ...)
{
	BString<1024> tmp2;

	va_list ap;
	va_start(ap, format);
	tmp2.FormatV(format, ap);
	va_end(ap);

	if (!m_logPrefix.Empty())
	{
		AddMessage(kind, BString<1024>("%s: %s", *m_logPrefix, *tmp2));
	}
	else
	{
		AddMessage(kind, tmp2);
	}
}
