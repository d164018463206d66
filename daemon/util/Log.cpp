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
#include "Options.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

Log::Log()
{
	g_Log = this;

#ifdef DEBUG
	m_extraDebug = FileSystem::FileExists("extradebug");
#endif
}

Log::~Log()
{
	g_Log = nullptr;
}

const char* Log::KindName(Message::EKind kind)
{
	const char* messageType[] = { "INFO", "WARNING", "ERROR", "DEBUG", "DETAIL" };
	return messageType[kind];
}

void Log::Filelog(const char* msg, ...)
{
	if (m_logFilename.Empty())
	{
		return;
	}

	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	char time[50];
	Util::FormatTime(Util::CurrentTime(), time, 50);

	if (!m_logFile)
	{
		m_logFile = std::make_unique<DiskFile>();
		if (!m_logFile->Open(m_logFilename, DiskFile::omAppend))
		{
			perror(m_logFilename);
			m_logFile.reset();
			return;
		}
	}

#ifdef DEBUG
	uint64 processId = (uint64)getpid();
	uint64 threadId = (uint64)pthread_self();
	m_logFile->Print("%s\t%" PRIu64 "\t%" PRIu64 "\t%s%s", time, processId, threadId, tmp2, LINE_ENDING);
#else
	m_logFile->Print("%s\t%s%s", time, tmp2, LINE_ENDING);
#endif

	m_logFile->Flush();
}

// Must be called with "m_logMutex" locked
void Log::Dispatch(Message::EKind kind, const char* text)
{
	Options::EMessageTarget messageTarget = Options::mtScreen;
	if (g_Options)
	{
		switch (kind)
		{
			case Message::mkError:
				messageTarget = g_Options->GetErrorTarget();
				break;
			case Message::mkWarning:
				messageTarget = g_Options->GetWarningTarget();
				break;
			case Message::mkInfo:
				messageTarget = g_Options->GetInfoTarget();
				break;
			case Message::mkDetail:
				messageTarget = g_Options->GetDetailTarget();
				break;
			case Message::mkDebug:
				messageTarget = g_Options->GetDebugTarget();
				break;
		}
	}
	else if (kind == Message::mkError)
	{
		messageTarget = Options::mtBoth;
	}

	if (messageTarget == Options::mtScreen || messageTarget == Options::mtBoth)
	{
		AddMessage(kind, text);
	}
	if (messageTarget == Options::mtLog || messageTarget == Options::mtBoth)
	{
		Filelog("%s\t%s", KindName(kind), text);
	}
}

#ifdef DEBUG
#undef debug
#ifdef HAVE_VARIADIC_MACROS
void debug(const char* filename, const char* funcname, int lineNr, const char* msg, ...)
#else
void debug(const char* msg, ...)
#endif
{
	if (!g_Log)
	{
		return;
	}

	char tmp1[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp1, 1024, msg, ap);
	tmp1[1024-1] = '\0';
	va_end(ap);

	BString<1024> tmp2;
#ifdef HAVE_VARIADIC_MACROS
	if (funcname)
	{
		tmp2.Format("%s (%s:%i:%s)", tmp1, FileSystem::BaseFileName(filename), lineNr, funcname);
	}
	else
	{
		tmp2.Format("%s (%s:%i)", tmp1, FileSystem::BaseFileName(filename), lineNr);
	}
#else
	tmp2.Format("%s", tmp1);
#endif

	Guard guard(g_Log->m_logMutex);

	if (!g_Options && g_Log->m_extraDebug)
	{
		printf("%s\n", *tmp2);
	}

	g_Log->Dispatch(Message::mkDebug, tmp2);
}
#endif

#define LOG_DISPATCH(kind) \
	if (!g_Log) \
	{ \
		return; \
	} \
	char tmp2[1024]; \
	va_list ap; \
	va_start(ap, msg); \
	vsnprintf(tmp2, 1024, msg, ap); \
	tmp2[1024-1] = '\0'; \
	va_end(ap); \
	Guard guard(g_Log->m_logMutex); \
	g_Log->Dispatch(kind, tmp2);

void error(const char* msg, ...)
{
	LOG_DISPATCH(Message::mkError);
}

void warn(const char* msg, ...)
{
	LOG_DISPATCH(Message::mkWarning);
}

void info(const char* msg, ...)
{
	LOG_DISPATCH(Message::mkInfo);
}

void detail(const char* msg, ...)
{
	LOG_DISPATCH(Message::mkDetail);
}

void Log::Clear()
{
	Guard guard(m_logMutex);
	m_messages.clear();
}

void Log::AddMessage(Message::EKind kind, const char * text)
{
	m_messages.emplace_back(++m_idGen, kind, Util::CurrentTime(), text);

	if (m_optInit && g_Options)
	{
		while (m_messages.size() > (uint32)g_Options->GetLogBuffer())
		{
			m_messages.pop_front();
		}
	}
}

void Log::ResetLog()
{
	FileSystem::DeleteFile(g_Options->GetLogFile());
}

/*
* During intializing stage (when options were not read yet) all messages
* are saved in screen log, even if they shouldn't (according to options).
* Method "InitOptions()" check all messages added to screen log during
* intializing stage and does three things:
* 1) save the messages to log-file (if they should according to options);
* 2) delete messages from screen log (if they should not be saved in screen log).
* 3) renumerate IDs
*/
void Log::InitOptions()
{
	Guard guard(m_logMutex);

	if (g_Options->GetWriteLog() != Options::wlNone && !Util::EmptyStr(g_Options->GetLogFile()))
	{
		m_logFilename = g_Options->GetLogFile();
		if (g_Options->GetWriteLog() == Options::wlReset)
		{
			ResetLog();
		}
	}

	m_idGen = 0;

	for (uint32 i = 0; i < m_messages.size(); )
	{
		Message& message = m_messages.at(i);
		Options::EMessageTarget target = Options::mtNone;
		switch (message.GetKind())
		{
			case Message::mkDebug:
				target = g_Options->GetDebugTarget();
				break;
			case Message::mkDetail:
				target = g_Options->GetDetailTarget();
				break;
			case Message::mkInfo:
				target = g_Options->GetInfoTarget();
				break;
			case Message::mkWarning:
				target = g_Options->GetWarningTarget();
				break;
			case Message::mkError:
				target = g_Options->GetErrorTarget();
				break;
		}

		if (target == Options::mtLog || target == Options::mtBoth)
		{
			Filelog("%s\t%s", KindName(message.GetKind()), message.GetText());
		}

		if (target == Options::mtLog || target == Options::mtNone)
		{
			m_messages.erase(m_messages.begin() + i);
		}
		else
		{
			message.m_id = ++m_idGen;
			i++;
		}
	}

	m_optInit = true;
}
