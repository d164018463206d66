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


#ifndef COMMANDLINEPARSER_H
#define COMMANDLINEPARSER_H

#include "NString.h"

class CommandLineParser
{
public:
	enum EVerbosity
	{
		vbNormal,
		vbQuiet,
		vbVerbose
	};

	typedef std::vector<CString> NameList;

	CommandLineParser(int argc, const char* argv[]);
	void PrintUsage(const char* com);
	bool GetErrors() { return m_errors; }
	bool GetNoConfig() { return m_noConfig; }
	const char* GetConfigFilename() { return m_configFilename; }
	NameList* GetOptionList() { return &m_optionList; }
	bool GetDiscover() { return m_discover; }
	bool GetDownload() { return m_download; }
	const char* GetDownloadEntry() { return m_downloadEntry; }
	int GetWorkers() { return m_workers; }
	int GetRetries() { return m_retries; }
	EVerbosity GetVerbosity() { return m_verbosity; }
	bool GetPrintVersion() { return m_printVersion; }
	bool GetPrintUsage() { return m_printUsage; }

private:
	bool m_noConfig = false;
	CString m_configFilename;

	// Parsed command-line parameters
	bool m_errors = false;
	bool m_printVersion = false;
	bool m_printUsage = false;
	NameList m_optionList;
	bool m_discover = false;
	bool m_download = false;
	CString m_downloadEntry;
	int m_workers = 0;
	int m_retries = -1;
	EVerbosity m_verbosity = vbNormal;

	void InitCommandLine(int argc, const char* argv[]);
	bool ParseNumber(const char* value, int minValue, int& result);
	void ReportError(const char* errMessage);
};

#endif
