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
#include "CommandLineParser.h"
#include "Log.h"
#include "Util.h"
#include "FileSystem.h"

#ifdef HAVE_GETOPT_LONG
static struct option long_options[] =
	{
		{"help", no_argument, 0, 'h'},
		{"configfile", required_argument, 0, 'c'},
		{"noconfigfile", no_argument, 0, 'n'},
		{"version", no_argument, 0, 'v'},
		{"option", required_argument, 0, 'o'},
		{"discover", no_argument, 0, 'd'},
		{"download", no_argument, 0, 'l'},
		{"get", required_argument, 0, 'g'},
		{"workers", required_argument, 0, 'w'},
		{"retries", required_argument, 0, 'r'},
		{"quiet", no_argument, 0, 'q'},
		{"verbose", no_argument, 0, 'V'},
		{0, 0, 0, 0}
	};
#endif

static char short_options[] = "c:hno:vdlg:w:r:qV";


CommandLineParser::CommandLineParser(int argc, const char* argv[])
{
	InitCommandLine(argc, argv);

	if (!m_errors && !m_printUsage && !m_printVersion &&
		!m_discover && !m_download && m_downloadEntry.Empty())
	{
		// discovery is the default action
		m_discover = true;
	}
}

void CommandLineParser::InitCommandLine(int argc, const char* const_argv[])
{
	std::vector<CString> argv;
	argv.reserve(argc);
	for (int i = 0; i < argc; i++)
	{
		argv.emplace_back(const_argv[i]);
	}

	// reset getopt
	optind = 0;

	while (true)
	{
		int c;

#ifdef HAVE_GETOPT_LONG
		int option_index  = 0;
		c = getopt_long(argc, (char**)argv.data(), short_options, long_options, &option_index);
#else
		c = getopt(argc, (char**)argv.data(), short_options);
#endif

		if (c == -1) break;

		switch (c)
		{
			case 'c':
				m_configFilename = optarg;
				break;
			case 'n':
				m_configFilename = nullptr;
				m_noConfig = true;
				break;
			case 'h':
				m_printUsage = true;
				return;
			case 'v':
				m_printVersion = true;
				return;
			case 'o':
				m_optionList.push_back(optarg);
				break;
			case 'd':
				m_discover = true;
				break;
			case 'l':
				m_download = true;
				break;
			case 'g':
				if (Util::EmptyStr(optarg))
				{
					ReportError("Could not parse value of option 'g'");
					return;
				}
				m_downloadEntry = optarg;
				break;
			case 'w':
				if (!ParseNumber(optarg, 1, m_workers))
				{
					ReportError("Could not parse value of option 'w'");
					return;
				}
				break;
			case 'r':
				if (!ParseNumber(optarg, 0, m_retries))
				{
					ReportError("Could not parse value of option 'r'");
					return;
				}
				break;
			case 'q':
				m_verbosity = vbQuiet;
				break;
			case 'V':
				m_verbosity = vbVerbose;
				break;
			case '?':
				m_errors = true;
				return;
		}
	}

	if (optind < argc)
	{
		BString<1024> errmsg("Unexpected argument \"%s\"", *argv[optind]);
		ReportError(errmsg);
		return;
	}

	if (!m_downloadEntry.Empty() && m_download)
	{
		ReportError("Options 'g' and 'l' cannot be used together");
		return;
	}
}

bool CommandLineParser::ParseNumber(const char* value, int minValue, int& result)
{
	if (Util::EmptyStr(value))
	{
		return false;
	}

	char* endptr;
	long num = strtol(value, &endptr, 10);
	if (*endptr != '\0' || num < minValue || num > 1000)
	{
		return false;
	}

	result = (int)num;
	return true;
}

void CommandLineParser::PrintUsage(const char* com)
{
	printf("Usage:\n"
		"  %s [switches]\n\n"
		"Switches:\n"
		"  -h, --help                Print this help-message\n"
		"  -v, --version             Print version and exit\n"
		"  -c, --configfile <file>   Filename of configuration-file\n"
		"  -n, --noconfigfile        Prevent loading of configuration-file\n"
		"                            (required options must be passed with --option)\n"
		"  -o, --option <name=value> Set or override option in configuration-file\n"
		"  -d, --discover            Discover new videos of all channels and add them\n"
		"                            to the queue (default action)\n"
		"  -l, --download            Download all pending queue entries\n"
		"  -g, --get <entry>         Download one queue entry (name or path)\n"
		"  -w, --workers <count>     Number of parallel workers for selected actions\n"
		"  -r, --retries <count>     Retries per channel on temporary errors\n"
		"  -q, --quiet               Print only the summary\n"
		"  -V, --verbose             Print detail messages on screen\n",
		FileSystem::BaseFileName(com));
}

void CommandLineParser::ReportError(const char* errMessage)
{
	m_errors = true;
	printf("%s\n", errMessage);
}
