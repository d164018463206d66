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


#ifndef OPTIONS_H
#define OPTIONS_H

#include "NString.h"
#include "Thread.h"
#include "Util.h"

class Options
{
public:
	enum EWriteLog
	{
		wlNone,
		wlAppend,
		wlReset
	};
	enum EMessageTarget
	{
		mtNone,
		mtScreen,
		mtLog,
		mtBoth
	};
	enum EOutputMode
	{
		omLoggable,
		omColored
	};
	enum ELister
	{
		lsYtDlp,
		lsFixture
	};
	enum EDownloader
	{
		dlYtDlp,
		dlFixture
	};

	class OptEntry
	{
	public:
		OptEntry(const char* name, const char* value) :
			m_name(name), m_value(value) {}
		void SetName(const char* name) { m_name = name; }
		const char* GetName() { return m_name; }
		void SetValue(const char* value);
		const char* GetValue() { return m_value; }
		const char* GetDefValue() { return m_defValue; }
		int GetLineNo() { return m_lineNo; }

	private:
		CString m_name;
		CString m_value;
		CString m_defValue;
		int m_lineNo = 0;

		void SetLineNo(int lineNo) { m_lineNo = lineNo; }

		friend class Options;
	};

	typedef std::deque<OptEntry> OptEntriesBase;

	class OptEntries: public OptEntriesBase
	{
	public:
		OptEntry* FindOption(const char* name);
	};

	typedef std::vector<const char*> CmdOptList;

	Options(const char* exeName, const char* configFilename, bool noConfig, CmdOptList* commandLineOptions);
	Options(CmdOptList* commandLineOptions);
	~Options();

	const char* GetOption(const char* optname);

	// Options
	const char* GetConfigFilename() { return m_configFilename; }
	const char* GetAppDir() { return m_appDir; }
	const char* GetMainDir() { return m_mainDir; }
	const char* GetChannelDir() { return m_channelDir; }
	const char* GetQueueDir() { return m_queueDir; }
	const char* GetDestDir() { return m_destDir; }
	const char* GetSymlinkDir() { return m_symlinkDir; }
	const char* GetTempDir() { return m_tempDir; }
	const char* GetLogFile() { return m_logFile; }
	EWriteLog GetWriteLog() { return m_writeLog; }
	EMessageTarget GetInfoTarget() { return m_infoTarget; }
	EMessageTarget GetWarningTarget() { return m_warningTarget; }
	EMessageTarget GetErrorTarget() { return m_errorTarget; }
	EMessageTarget GetDebugTarget() { return m_debugTarget; }
	EMessageTarget GetDetailTarget() { return m_detailTarget; }
	int GetLogBuffer() { return m_logBuffer; }
	EOutputMode GetOutputMode() { return m_outputMode; }
	int GetUpdateInterval() { return m_updateInterval; }
	int GetDiscoveryWorkers() { return m_discoveryWorkers; }
	int GetDownloadWorkers() { return m_downloadWorkers; }
	int GetMaxRetries() { return m_maxRetries; }
	int GetRetryDelay() { return m_retryDelay; }
	int GetProbeItems() { return m_probeItems; }
	ELister GetLister() { return m_lister; }
	EDownloader GetDownloader() { return m_downloader; }
	const char* GetYtDlpCmd() { return m_ytDlpCmd; }
	const char* GetCookiesFromBrowser() { return m_cookiesFromBrowser; }
	const char* GetSubtitleLanguages() { return m_subtitleLanguages; }
	const char* GetExtractorArgs() { return m_extractorArgs; }

	// Parameters from command line
	void SetDiscoveryWorkers(int workers) { m_discoveryWorkers = workers; }
	void SetDownloadWorkers(int workers) { m_downloadWorkers = workers; }
	void SetMaxRetries(int maxRetries) { m_maxRetries = maxRetries; }

	bool GetFatalError() { return m_fatalError; }
	bool GetConfigErrors() { return m_configErrors; }

private:
	void Init(const char* exeName, const char* configFilename, bool noConfig,
		CmdOptList* commandLineOptions, bool noDiskAccess);

	OptEntries m_optEntries;
	bool m_noDiskAccess = false;
	bool m_noConfig = false;
	bool m_fatalError = false;
	bool m_configErrors = false;
	bool m_initDefaults = false;
	int m_configLine = 0;
	CString m_appDir;
	CString m_configFilename;

	CString m_mainDir;
	CString m_channelDir;
	CString m_queueDir;
	CString m_destDir;
	CString m_symlinkDir;
	CString m_tempDir;
	CString m_logFile;
	EWriteLog m_writeLog = wlAppend;
	EMessageTarget m_infoTarget = mtScreen;
	EMessageTarget m_warningTarget = mtScreen;
	EMessageTarget m_errorTarget = mtBoth;
	EMessageTarget m_debugTarget = mtNone;
	EMessageTarget m_detailTarget = mtLog;
	int m_logBuffer = 1000;
	EOutputMode m_outputMode = omColored;
	int m_updateInterval = 200;
	int m_discoveryWorkers = 5;
	int m_downloadWorkers = 3;
	int m_maxRetries = 3;
	int m_retryDelay = 1000;
	int m_probeItems = 5;
	ELister m_lister = lsYtDlp;
	EDownloader m_downloader = dlYtDlp;
	CString m_ytDlpCmd;
	CString m_cookiesFromBrowser;
	CString m_subtitleLanguages;
	CString m_extractorArgs;

	void InitDefaults();
	void ExpandDefaults();
	void InitOptions();
	void InitOptFile();
	void InitCommandLineOptions(CmdOptList* commandLineOptions);
	void CheckOptions();
	int ParseEnumValue(const char* OptName, int argc, const char* argn[], const int argv[]);
	int ParseIntValue(const char* OptName, int base);
	OptEntry* FindOption(const char* optname);
	void SetOption(const char* optname, const char* value);
	bool SetOptionString(const char* option);
	bool ValidateOptionName(const char* optname);
	void LoadConfigFile();
	void CheckDir(CString& dir, const char* optionName, const char* parentDir,
		bool allowEmpty, bool create);
	void CheckRange(int& value, const char* optionName, int minValue, int maxValue);
	void ConfigError(const char* msg, ...) PRINTF_SYNTAX(2);
	void LocateOptionSrcPos(const char *optionName);

public:
	static bool SplitOptionString(const char* option, CString& optName, CString& optValue);
};

extern Options* g_Options;

#endif
