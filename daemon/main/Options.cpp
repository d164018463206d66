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
#include "Util.h"
#include "FileSystem.h"
#include "Options.h"
#include "Log.h"

// Program options
static const char* OPTION_CONFIGFILE			= "ConfigFile";
static const char* OPTION_APPBIN				= "AppBin";
static const char* OPTION_APPDIR				= "AppDir";
static const char* OPTION_VERSION				= "Version";
static const char* OPTION_MAINDIR				= "MainDir";
static const char* OPTION_CHANNELDIR			= "ChannelDir";
static const char* OPTION_QUEUEDIR				= "QueueDir";
static const char* OPTION_DESTDIR				= "DestDir";
static const char* OPTION_SYMLINKDIR			= "SymlinkDir";
static const char* OPTION_TEMPDIR				= "TempDir";
static const char* OPTION_LOGFILE				= "LogFile";
static const char* OPTION_WRITELOG				= "WriteLog";
static const char* OPTION_INFOTARGET			= "InfoTarget";
static const char* OPTION_WARNINGTARGET			= "WarningTarget";
static const char* OPTION_ERRORTARGET			= "ErrorTarget";
static const char* OPTION_DEBUGTARGET			= "DebugTarget";
static const char* OPTION_DETAILTARGET			= "DetailTarget";
static const char* OPTION_LOGBUFFER				= "LogBuffer";
static const char* OPTION_OUTPUTMODE			= "OutputMode";
static const char* OPTION_UPDATEINTERVAL		= "UpdateInterval";
static const char* OPTION_DISCOVERYWORKERS		= "DiscoveryWorkers";
static const char* OPTION_DOWNLOADWORKERS		= "DownloadWorkers";
static const char* OPTION_MAXRETRIES			= "MaxRetries";
static const char* OPTION_RETRYDELAY			= "RetryDelay";
static const char* OPTION_PROBEITEMS			= "ProbeItems";
static const char* OPTION_LISTER				= "Lister";
static const char* OPTION_DOWNLOADER			= "Downloader";
static const char* OPTION_YTDLPCMD				= "YtDlpCmd";
static const char* OPTION_COOKIESFROMBROWSER	= "CookiesFromBrowser";
static const char* OPTION_SUBTITLELANGUAGES		= "SubtitleLanguages";
static const char* OPTION_EXTRACTORARGS			= "ExtractorArgs";


const char* PossibleConfigLocations[] =
	{
		"~/.channelget",
		"/etc/channelget.conf",
		"/usr/etc/channelget.conf",
		"/usr/local/etc/channelget.conf",
		nullptr
	};

void Options::OptEntry::SetValue(const char* value)
{
	m_value = value;
	if (!m_defValue)
	{
		m_defValue = value;
	}
}

Options::OptEntry* Options::OptEntries::FindOption(const char* name)
{
	if (!name)
	{
		return nullptr;
	}

	for (OptEntry& optEntry : *this)
	{
		if (!strcasecmp(optEntry.GetName(), name))
		{
			return &optEntry;
		}
	}

	return nullptr;
}


Options::Options(const char* exeName, const char* configFilename, bool noConfig,
	CmdOptList* commandLineOptions)
{
	Init(exeName, configFilename, noConfig, commandLineOptions, false);
}

Options::Options(CmdOptList* commandLineOptions)
{
	Init("channelget/channelget", nullptr, true, commandLineOptions, true);
}

void Options::Init(const char* exeName, const char* configFilename, bool noConfig,
	CmdOptList* commandLineOptions, bool noDiskAccess)
{
	g_Options = this;
	m_noDiskAccess = noDiskAccess;
	m_noConfig = noConfig;
	m_configFilename = configFilename;

	SetOption(OPTION_CONFIGFILE, "");

	CString filename;
	if (m_noDiskAccess)
	{
		filename = exeName;
	}
	else
	{
		filename = FileSystem::GetExeFileName(exeName);
	}
	FileSystem::NormalizePathSeparators(filename);
	SetOption(OPTION_APPBIN, filename);
	char* end = strrchr(filename, PATH_SEPARATOR);
	if (end) *end = '\0';
	SetOption(OPTION_APPDIR, filename);
	m_appDir = *filename;

	SetOption(OPTION_VERSION, Util::VersionRevision());

	InitDefaults();

	InitOptFile();
	if (m_fatalError)
	{
		return;
	}

	if (commandLineOptions)
	{
		InitCommandLineOptions(commandLineOptions);
	}

	ExpandDefaults();

	if (!m_configFilename && !noConfig)
	{
		printf("No configuration-file found\n");
		printf("Please use option \"-c\" or put configuration-file in one of the following locations:\n");
		int p = 0;
		while (const char* filename = PossibleConfigLocations[p++])
		{
			printf("%s\n", filename);
		}
		printf("%s/channelget.conf\n", *m_appDir);
		m_fatalError = true;
		return;
	}

	InitOptions();
	CheckOptions();
}

Options::~Options()
{
	g_Options = nullptr;
}

void Options::ConfigError(const char* msg, ...)
{
	char tmp2[1024];

	va_list ap;
	va_start(ap, msg);
	vsnprintf(tmp2, 1024, msg, ap);
	tmp2[1024-1] = '\0';
	va_end(ap);

	printf("%s(%i): %s\n", m_configFilename ? FileSystem::BaseFileName(m_configFilename) : "<noconfig>", m_configLine, tmp2);
	error("%s(%i): %s", m_configFilename ? FileSystem::BaseFileName(m_configFilename) : "<noconfig>", m_configLine, tmp2);

	m_configErrors = true;
}

void Options::LocateOptionSrcPos(const char *optionName)
{
	OptEntry* optEntry = FindOption(optionName);
	if (optEntry)
	{
		m_configLine = optEntry->GetLineNo();
	}
	else
	{
		m_configLine = 0;
	}
}

void Options::InitDefaults()
{
	// variables in defaults are expanded after the configuration is read
	m_initDefaults = true;

	SetOption(OPTION_MAINDIR, "~/channelget");
	SetOption(OPTION_CHANNELDIR, "${MainDir}/channels");
	SetOption(OPTION_QUEUEDIR, "${MainDir}/queue");
	SetOption(OPTION_DESTDIR, "${MainDir}/videos");
	SetOption(OPTION_SYMLINKDIR, "");
	SetOption(OPTION_TEMPDIR, "${MainDir}/tmp");
	SetOption(OPTION_LOGFILE, "${MainDir}/channelget.log");
	SetOption(OPTION_WRITELOG, "append");
	SetOption(OPTION_INFOTARGET, "screen");
	SetOption(OPTION_WARNINGTARGET, "both");
	SetOption(OPTION_ERRORTARGET, "both");
	SetOption(OPTION_DEBUGTARGET, "none");
	SetOption(OPTION_DETAILTARGET, "log");
	SetOption(OPTION_LOGBUFFER, "1000");
	SetOption(OPTION_OUTPUTMODE, "colored");
	SetOption(OPTION_UPDATEINTERVAL, "200");
	SetOption(OPTION_DISCOVERYWORKERS, "5");
	SetOption(OPTION_DOWNLOADWORKERS, "3");
	SetOption(OPTION_MAXRETRIES, "3");
	SetOption(OPTION_RETRYDELAY, "1000");
	SetOption(OPTION_PROBEITEMS, "5");
	SetOption(OPTION_LISTER, "ytdlp");
	SetOption(OPTION_DOWNLOADER, "ytdlp");
	SetOption(OPTION_YTDLPCMD, "yt-dlp");
	SetOption(OPTION_COOKIESFROMBROWSER, "");
	SetOption(OPTION_SUBTITLELANGUAGES, "");
	SetOption(OPTION_EXTRACTORARGS, "youtube:player_client=default,web_safari");

	m_initDefaults = false;
}

void Options::ExpandDefaults()
{
	for (OptEntry& optEntry : m_optEntries)
	{
		if (optEntry.GetLineNo() == 0 && !Util::EmptyStr(optEntry.GetValue()) && strstr(optEntry.GetValue(), "${"))
		{
			CString value = optEntry.GetValue();
			SetOption(optEntry.GetName(), value);
		}
	}
}

void Options::InitOptFile()
{
	if (!m_configFilename && !m_noConfig)
	{
		// search for config file in default locations
		int p = 0;
		while (const char* altfilename = PossibleConfigLocations[p++])
		{
			// substitute HOME-variable
			CString filename = FileSystem::ExpandHomePath(altfilename);

			if (FileSystem::FileExists(filename))
			{
				m_configFilename = *filename;
				break;
			}
		}

		// the exe-directory is the last resort
		BString<1024> filename("%s/channelget.conf", *m_appDir);
		if (!m_configFilename && FileSystem::FileExists(filename))
		{
			m_configFilename = *filename;
		}
	}

	if (m_configFilename)
	{
		// substitute HOME-variable
		CString filename = FileSystem::ExpandHomePath(m_configFilename);

		// normalize path in filename
		CString fullFilename = FileSystem::ExpandFileName(filename);
		m_configFilename = fullFilename.Empty() ? *filename : *fullFilename;

		SetOption(OPTION_CONFIGFILE, m_configFilename);
		LoadConfigFile();
	}
}

void Options::CheckDir(CString& dir, const char* optionName,
	const char* parentDir, bool allowEmpty, bool create)
{
	const char* tempdir = GetOption(optionName);

	if (m_noDiskAccess)
	{
		dir = tempdir;
		return;
	}

	if (Util::EmptyStr(tempdir))
	{
		if (!allowEmpty)
		{
			ConfigError("Invalid value for option \"%s\": <empty>", optionName);
		}
		dir = "";
		return;
	}

	dir = tempdir;
	FileSystem::NormalizePathSeparators((char*)dir);
	if (dir.Length() > 1 && dir[dir.Length() - 1] == PATH_SEPARATOR)
	{
		// remove trailing slash
		dir[dir.Length() - 1] = '\0';
	}

	if (!FileSystem::IsAbsolutePath(dir) && !Util::EmptyStr(parentDir))
	{
		// convert relative path to absolute path
		int plen = strlen(parentDir);

		BString<1024> usedir2;
		if (parentDir[plen-1] == PATH_SEPARATOR)
		{
			usedir2.Format("%s%s", parentDir, *dir);
		}
		else
		{
			usedir2.Format("%s%c%s", parentDir, PATH_SEPARATOR, *dir);
		}

		FileSystem::NormalizePathSeparators((char*)usedir2);
		dir = usedir2;
		SetOption(optionName, usedir2);
	}

	// Ensure the dir is created
	CString errmsg;
	if (create && !FileSystem::ForceDirectories(dir, errmsg))
	{
		ConfigError("Invalid value for option \"%s\" (%s): %s", optionName, *dir, *errmsg);
	}
}

void Options::CheckRange(int& value, const char* optionName, int minValue, int maxValue)
{
	if (value < minValue || value > maxValue)
	{
		LocateOptionSrcPos(optionName);
		ConfigError("Invalid value for option \"%s\": %i, allowed range %i..%i",
			optionName, value, minValue, maxValue);
		value = std::min(std::max(value, minValue), maxValue);
	}
}

void Options::InitOptions()
{
	// relative main dir is resolved against the directory of the config file
	CString configDir;
	if (m_configFilename)
	{
		configDir = *m_configFilename;
		char* end = strrchr(configDir, PATH_SEPARATOR);
		if (end) *end = '\0';
	}
	else
	{
		configDir = FileSystem::GetCurrentDirectory();
	}

	CheckDir(m_mainDir, OPTION_MAINDIR, configDir, false, false);
	CheckDir(m_channelDir, OPTION_CHANNELDIR, m_mainDir, false, true);
	CheckDir(m_queueDir, OPTION_QUEUEDIR, m_mainDir, false, true);
	CheckDir(m_destDir, OPTION_DESTDIR, m_mainDir, false, true);
	CheckDir(m_symlinkDir, OPTION_SYMLINKDIR, m_mainDir, true, true);
	CheckDir(m_tempDir, OPTION_TEMPDIR, m_mainDir, false, true);

	m_logFile				= GetOption(OPTION_LOGFILE);
	m_ytDlpCmd				= GetOption(OPTION_YTDLPCMD);
	m_cookiesFromBrowser	= GetOption(OPTION_COOKIESFROMBROWSER);
	m_subtitleLanguages		= GetOption(OPTION_SUBTITLELANGUAGES);
	m_extractorArgs			= GetOption(OPTION_EXTRACTORARGS);

	m_logBuffer				= ParseIntValue(OPTION_LOGBUFFER, 10);
	m_updateInterval		= ParseIntValue(OPTION_UPDATEINTERVAL, 10);
	m_discoveryWorkers		= ParseIntValue(OPTION_DISCOVERYWORKERS, 10);
	m_downloadWorkers		= ParseIntValue(OPTION_DOWNLOADWORKERS, 10);
	m_maxRetries			= ParseIntValue(OPTION_MAXRETRIES, 10);
	m_retryDelay			= ParseIntValue(OPTION_RETRYDELAY, 10);
	m_probeItems			= ParseIntValue(OPTION_PROBEITEMS, 10);

	const char* WriteLogNames[] = { "none", "append", "reset" };
	const int WriteLogValues[] = { wlNone, wlAppend, wlReset };
	const int WriteLogCount = 3;
	m_writeLog = (EWriteLog)ParseEnumValue(OPTION_WRITELOG, WriteLogCount, WriteLogNames, WriteLogValues);

	const char* TargetNames[] = { "screen", "log", "both", "none" };
	const int TargetValues[] = { mtScreen, mtLog, mtBoth, mtNone };
	const int TargetCount = 4;
	m_infoTarget = (EMessageTarget)ParseEnumValue(OPTION_INFOTARGET, TargetCount, TargetNames, TargetValues);
	m_warningTarget = (EMessageTarget)ParseEnumValue(OPTION_WARNINGTARGET, TargetCount, TargetNames, TargetValues);
	m_errorTarget = (EMessageTarget)ParseEnumValue(OPTION_ERRORTARGET, TargetCount, TargetNames, TargetValues);
	m_debugTarget = (EMessageTarget)ParseEnumValue(OPTION_DEBUGTARGET, TargetCount, TargetNames, TargetValues);
	m_detailTarget = (EMessageTarget)ParseEnumValue(OPTION_DETAILTARGET, TargetCount, TargetNames, TargetValues);

	const char* OutputModeNames[] = { "loggable", "logable", "log", "colored", "color" };
	const int OutputModeValues[] = { omLoggable, omLoggable, omLoggable, omColored, omColored };
	const int OutputModeCount = 5;
	m_outputMode = (EOutputMode)ParseEnumValue(OPTION_OUTPUTMODE, OutputModeCount, OutputModeNames, OutputModeValues);

	const char* ListerNames[] = { "ytdlp", "yt-dlp", "fixture" };
	const int ListerValues[] = { lsYtDlp, lsYtDlp, lsFixture };
	const int ListerCount = 3;
	m_lister = (ELister)ParseEnumValue(OPTION_LISTER, ListerCount, ListerNames, ListerValues);

	const char* DownloaderNames[] = { "ytdlp", "yt-dlp", "fixture" };
	const int DownloaderValues[] = { dlYtDlp, dlYtDlp, dlFixture };
	const int DownloaderCount = 3;
	m_downloader = (EDownloader)ParseEnumValue(OPTION_DOWNLOADER, DownloaderCount, DownloaderNames, DownloaderValues);
}

int Options::ParseEnumValue(const char* OptName, int argc, const char * argn[], const int argv[])
{
	OptEntry* optEntry = FindOption(OptName);
	if (!optEntry)
	{
		ConfigError("Undefined value for option \"%s\"", OptName);
		return argv[0];
	}

	int defNum = 0;

	for (int i = 0; i < argc; i++)
	{
		if (!strcasecmp(optEntry->GetValue(), argn[i]))
		{
			// normalizing option value in option list, for example "NO" -> "no"
			for (int j = 0; j < argc; j++)
			{
				if (argv[j] == argv[i])
				{
					if (strcmp(argn[j], optEntry->GetValue()))
					{
						optEntry->SetValue(argn[j]);
					}
					break;
				}
			}

			return argv[i];
		}

		if (!strcasecmp(optEntry->GetDefValue(), argn[i]))
		{
			defNum = i;
		}
	}

	m_configLine = optEntry->GetLineNo();
	ConfigError("Invalid value for option \"%s\": \"%s\"", OptName, optEntry->GetValue());
	optEntry->SetValue(argn[defNum]);
	return argv[defNum];
}

int Options::ParseIntValue(const char* OptName, int base)
{
	OptEntry* optEntry = FindOption(OptName);
	if (!optEntry)
	{
		ConfigError("Undefined value for option \"%s\"", OptName);
		return 0;
	}

	char *endptr;
	int val = strtol(optEntry->GetValue(), &endptr, base);

	if (Util::EmptyStr(optEntry->GetValue()) || (endptr && *endptr != '\0'))
	{
		m_configLine = optEntry->GetLineNo();
		ConfigError("Invalid value for option \"%s\": \"%s\"", OptName, optEntry->GetValue());
		optEntry->SetValue(optEntry->GetDefValue());
		val = strtol(optEntry->GetDefValue(), nullptr, base);
	}

	return val;
}

void Options::SetOption(const char* optname, const char* value)
{
	OptEntry* optEntry = FindOption(optname);
	if (!optEntry)
	{
		m_optEntries.emplace_back(optname, nullptr);
		optEntry = &m_optEntries.back();
	}

	CString curvalue;

	if (value && (value[0] == '~') && (value[1] == '/') && !m_noDiskAccess)
	{
		curvalue = FileSystem::ExpandHomePath(value);
	}
	else
	{
		curvalue = value;
	}

	optEntry->SetLineNo(m_configLine);

	// expand variables
	while (const char* dollar = m_initDefaults ? nullptr : strstr(curvalue, "${"))
	{
		const char* end = strchr(dollar, '}');
		if (end)
		{
			int varlen = (int)(end - dollar - 2);
			BString<100> variable;
			variable.Set(dollar + 2, varlen);
			const char* varvalue = GetOption(variable);
			if (varvalue)
			{
				curvalue.Replace((int)(dollar - curvalue), 2 + varlen + 1, varvalue);
			}
			else
			{
				break;
			}
		}
		else
		{
			break;
		}
	}

	optEntry->SetValue(curvalue);
}

Options::OptEntry* Options::FindOption(const char* optname)
{
	OptEntry* optEntry = m_optEntries.FindOption(optname);

	// normalize option name in option list; for example "maindir" -> "MainDir"
	if (optEntry && strcmp(optEntry->GetName(), optname))
	{
		optEntry->SetName(optname);
	}

	return optEntry;
}

const char* Options::GetOption(const char* optname)
{
	OptEntry* optEntry = FindOption(optname);
	if (optEntry)
	{
		if (optEntry->GetLineNo() > 0)
		{
			m_configLine = optEntry->GetLineNo();
		}
		return optEntry->GetValue();
	}
	return nullptr;
}

void Options::LoadConfigFile()
{
	DiskFile infile;

	if (!infile.Open(m_configFilename, DiskFile::omRead))
	{
		ConfigError("Could not open file %s", *m_configFilename);
		m_fatalError = true;
		return;
	}

	m_configLine = 0;
	int bufLen = (int)FileSystem::FileSize(m_configFilename) + 1;
	CharBuffer buf(bufLen);

	int line = 0;
	while (infile.ReadLine(buf, buf.Size() - 1))
	{
		m_configLine = ++line;

		Util::TrimRight(buf);

		if (buf[0] == 0 || buf[0] == '#' || strspn(buf, " \t") == strlen(buf))
		{
			continue;
		}

		SetOptionString(buf);
	}

	infile.Close();

	m_configLine = 0;
}

void Options::InitCommandLineOptions(CmdOptList* commandLineOptions)
{
	for (const char* option : *commandLineOptions)
	{
		SetOptionString(option);
	}
}

bool Options::SetOptionString(const char* option)
{
	CString optname;
	CString optvalue;

	if (!SplitOptionString(option, optname, optvalue))
	{
		ConfigError("Invalid option \"%s\"", option);
		return false;
	}

	bool ok = ValidateOptionName(optname);
	if (ok)
	{
		SetOption(optname, optvalue);
	}
	else
	{
		ConfigError("Invalid option \"%s\"", *optname);
	}

	return ok;
}

/*
 * Splits option string into name and value;
 * Returns true if the option string has name and value;
 */
bool Options::SplitOptionString(const char* option, CString& optName, CString& optValue)
{
	const char* eq = strchr(option, '=');
	if (!eq || eq == option)
	{
		return false;
	}

	optName.Set(option, (int)(eq - option));
	optValue.Set(eq + 1);

	// spaces around "=" are allowed
	optName.TrimRight();
	char* value = Util::Trim(optValue);
	if (value != *optValue)
	{
		optValue = CString(value);
	}

	return !optName.Empty();
}

bool Options::ValidateOptionName(const char* optname)
{
	if (!strcasecmp(optname, OPTION_CONFIGFILE) || !strcasecmp(optname, OPTION_APPBIN) ||
		!strcasecmp(optname, OPTION_APPDIR) || !strcasecmp(optname, OPTION_VERSION))
	{
		// read-only options
		return false;
	}

	// only predefined options are accepted
	return GetOption(optname) != nullptr;
}

void Options::CheckOptions()
{
	CheckRange(m_discoveryWorkers, OPTION_DISCOVERYWORKERS, 1, 100);
	CheckRange(m_downloadWorkers, OPTION_DOWNLOADWORKERS, 1, 100);
	CheckRange(m_maxRetries, OPTION_MAXRETRIES, 0, 100);
	CheckRange(m_retryDelay, OPTION_RETRYDELAY, 0, 3600 * 1000);
	CheckRange(m_probeItems, OPTION_PROBEITEMS, 1, 1000);
	CheckRange(m_logBuffer, OPTION_LOGBUFFER, 1, 1000000);

	if (m_updateInterval < 10)
	{
		LocateOptionSrcPos(OPTION_UPDATEINTERVAL);
		ConfigError("Invalid value for option \"%s\": %i, must be at least 10", OPTION_UPDATEINTERVAL, m_updateInterval);
		m_updateInterval = 10;
	}

	if ((m_lister == lsYtDlp || m_downloader == dlYtDlp) && m_ytDlpCmd.Empty())
	{
		LocateOptionSrcPos(OPTION_YTDLPCMD);
		ConfigError("Invalid value for option \"%s\": <empty>", OPTION_YTDLPCMD);
	}
}
