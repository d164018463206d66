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
#include "Log.h"
#include "Options.h"
#include "CommandLineParser.h"
#include "Thread.h"
#include "ColoredFrontend.h"
#include "ChannelConfig.h"
#include "SourceLister.h"
#include "DiscoveryEngine.h"
#include "DiscoveryCoordinator.h"
#include "LinkQueue.h"
#include "Downloader.h"
#include "DownloadCoordinator.h"
#include "Util.h"
#include "FileSystem.h"
#include "StackTrace.h"
#include "ShutdownWatcher.h"
#ifdef ENABLE_TESTS
#include "TestMain.h"
#endif

// Prototypes
int RunMain();

// Globals
Log* g_Log;
Options* g_Options;
int g_ArgumentCount;
char* (*g_Arguments)[] = nullptr;


/*
 * Main entry point
 */
int main(int argc, char *argv[], char *argp[])
{
	Util::Init();

	g_ArgumentCount = argc;
	g_Arguments = (char*(*)[])argv;

	if (argc > 1 && (!strcmp(argv[1], "-tests") || !strcmp(argv[1], "--tests")))
	{
#ifdef ENABLE_TESTS
		return TestMain(argc, argv);
#else
		printf("ERROR: Could not start tests, the program was compiled without tests\n");
		return 1;
#endif
	}

#ifdef ENABLE_TESTS
	TestCleanup();
#endif

	return RunMain();
}


class ChannelGet
{
public:
	ChannelGet();
	~ChannelGet();
	int Run();
	void Stop();

private:
	// globals
	std::unique_ptr<Log> m_log;
	std::unique_ptr<Options> m_options;

	// non-globals
	std::unique_ptr<Frontend> m_frontend;
	std::unique_ptr<CommandLineParser> m_commandLineParser;
	Mutex m_coordinatorMutex;
	DiscoveryCoordinator* m_discoveryCoordinator = nullptr;
	DownloadCoordinator* m_downloadCoordinator = nullptr;
	bool m_stopped = false;
	ShutdownWatcher m_shutdownWatcher;

	void Init();
	void Final();
	void ShutdownCoordinators();
	void SetCoordinators(DiscoveryCoordinator* discoveryCoordinator, DownloadCoordinator* downloadCoordinator);
	void BootConfig();
	void Cleanup();
	void StartFrontend();
	void StopFrontend();
	int ProcessDiscovery();
	int ProcessDownload();
};

std::unique_ptr<ChannelGet> g_ChannelGet;

ChannelGet::ChannelGet() :
	m_shutdownWatcher([this]{ ShutdownCoordinators(); })
{
}

ChannelGet::~ChannelGet()
{
	Cleanup();
}

void ChannelGet::Init()
{
	m_log = std::make_unique<Log>();

	debug("channelget %s", Util::VersionRevision());

	Thread::Init();

	BootConfig();

	InstallErrorHandler();

	m_shutdownWatcher.Start();
}

void ChannelGet::Final()
{
	m_shutdownWatcher.Stop();
	while (m_shutdownWatcher.IsRunning())
	{
		Util::Sleep(50);
	}
}

void ChannelGet::BootConfig()
{
	debug("Parsing command line");
	m_commandLineParser = std::make_unique<CommandLineParser>(g_ArgumentCount, (const char**)(*g_Arguments));
	if (m_commandLineParser->GetPrintVersion())
	{
		printf("channelget version: %s\n", Util::VersionRevision());
		exit(0);
	}
	if (m_commandLineParser->GetPrintUsage() || m_commandLineParser->GetErrors())
	{
		m_commandLineParser->PrintUsage(((const char**)(*g_Arguments))[0]);
		exit(m_commandLineParser->GetPrintUsage() ? 0 : 1);
	}

	Options::CmdOptList cmdOpts;
	if (m_commandLineParser->GetVerbosity() == CommandLineParser::vbVerbose)
	{
		// explicit "-o DetailTarget=..." given later still wins
		cmdOpts.push_back("DetailTarget=both");
	}
	for (CString& option : *m_commandLineParser->GetOptionList())
	{
		cmdOpts.push_back(option);
	}

	debug("Reading options");
	m_options = std::make_unique<Options>((*g_Arguments)[0], m_commandLineParser->GetConfigFilename(),
		m_commandLineParser->GetNoConfig(), &cmdOpts);

	if (m_commandLineParser->GetWorkers() > 0)
	{
		if (m_commandLineParser->GetDiscover())
		{
			m_options->SetDiscoveryWorkers(m_commandLineParser->GetWorkers());
		}
		if (m_commandLineParser->GetDownload() || m_commandLineParser->GetDownloadEntry())
		{
			m_options->SetDownloadWorkers(m_commandLineParser->GetWorkers());
		}
	}
	if (m_commandLineParser->GetRetries() >= 0)
	{
		m_options->SetMaxRetries(m_commandLineParser->GetRetries());
	}

	m_log->InitOptions();

	if (m_options->GetFatalError())
	{
		exit(1);
	}
}

void ChannelGet::Cleanup()
{
	debug("Cleaning up global objects");

	m_frontend.reset();
	m_options.reset();
	g_Options = nullptr;
	m_log.reset();
}

void ChannelGet::StartFrontend()
{
	if (m_options->GetOutputMode() == Options::omColored)
	{
		m_frontend = std::make_unique<ColoredFrontend>();
	}
	else
	{
		m_frontend = std::make_unique<LoggableFrontend>();
	}

	switch (m_commandLineParser->GetVerbosity())
	{
		case CommandLineParser::vbQuiet:
			m_frontend->SetVerbosity(Frontend::fvQuiet);
			break;
		case CommandLineParser::vbVerbose:
			m_frontend->SetVerbosity(Frontend::fvVerbose);
			break;
		case CommandLineParser::vbNormal:
			m_frontend->SetVerbosity(Frontend::fvNormal);
			break;
	}

	m_frontend->Start();
}

void ChannelGet::StopFrontend()
{
	if (m_frontend)
	{
		debug("Stopping Frontend");
		m_frontend->Stop();
		while (m_frontend->IsRunning())
		{
			Util::Sleep(50);
		}
		debug("Frontend stopped");
	}
}

int ChannelGet::Run()
{
	Init();

	StartFrontend();

	info("channelget %s", Util::VersionRevision());

	int exitCode = 0;

	if (m_commandLineParser->GetDiscover() && !m_shutdownWatcher.GetRequested())
	{
		exitCode = ProcessDiscovery();
	}

	if ((m_commandLineParser->GetDownload() || m_commandLineParser->GetDownloadEntry()) &&
		!m_shutdownWatcher.GetRequested() && exitCode != 1)
	{
		int downloadCode = ProcessDownload();
		exitCode = std::max(exitCode, downloadCode);
	}

	StopFrontend();

	Final();

	return exitCode;
}

int ChannelGet::ProcessDiscovery()
{
	ChannelList channels;
	if (!ChannelLoader::LoadAll(m_options->GetChannelDir(), channels))
	{
		return 1;
	}

	if (channels.empty())
	{
		error("No channels configured in %s", m_options->GetChannelDir());
		return 1;
	}

	std::unique_ptr<SourceLister> lister = SourceLister::Create(m_options->GetLister());
	LinkQueue linkQueue(m_options->GetQueueDir());

	DiscoveryEngine engine(lister.get(), &linkQueue);
	engine.SetProbeItems(m_options->GetProbeItems());
	engine.SetDefaultSubtitleLanguages(m_options->GetSubtitleLanguages());
	engine.SetDefaultBrowserProfile(m_options->GetCookiesFromBrowser());
	engine.SetDefaultSymlinkDir(m_options->GetSymlinkDir());

	DiscoveryCoordinator coordinator(&engine);
	coordinator.SetWorkers(m_options->GetDiscoveryWorkers());
	coordinator.SetMaxRetries(m_options->GetMaxRetries());
	coordinator.SetRetryDelay(m_options->GetRetryDelay());

	m_frontend->AttachDiscovery(&coordinator);
	SetCoordinators(&coordinator, nullptr);

	ChannelResultList results = coordinator.FetchAll(channels);

	SetCoordinators(nullptr, nullptr);
	m_frontend->DetachDiscovery();

	DiscoverySummary summary(results, coordinator.GetElapsed());
	m_frontend->AddDiscoverySummary(summary, results);

	return summary.GetSucceeded() == summary.GetTotal() ? 0 : 2;
}

int ChannelGet::ProcessDownload()
{
	LinkQueue linkQueue(m_options->GetQueueDir());
	std::unique_ptr<Downloader> downloader = Downloader::Create(m_options->GetDownloader());

	DownloadCoordinator coordinator(&linkQueue, downloader.get(), m_options->GetDestDir());
	coordinator.SetWorkers(m_options->GetDownloadWorkers());

	m_frontend->AttachDownload(&coordinator);
	SetCoordinators(nullptr, &coordinator);

	int exitCode = 0;
	if (m_commandLineParser->GetDownloadEntry())
	{
		DownloadCoordinator::EResult result = coordinator.DownloadOne(m_commandLineParser->GetDownloadEntry());
		exitCode = result == DownloadCoordinator::drDone ? 0 : 2;
	}
	else
	{
		DownloadSummary summary = coordinator.Run();
		m_frontend->AddDownloadSummary(summary);
		exitCode = summary.GetBroken() + summary.GetFailed() > 0 ? 2 : 0;
	}

	SetCoordinators(nullptr, nullptr);
	m_frontend->DetachDownload();

	return exitCode;
}

void ChannelGet::SetCoordinators(DiscoveryCoordinator* discoveryCoordinator,
	DownloadCoordinator* downloadCoordinator)
{
	Guard guard(m_coordinatorMutex);
	m_discoveryCoordinator = discoveryCoordinator;
	m_downloadCoordinator = downloadCoordinator;
	if (m_stopped)
	{
		if (m_discoveryCoordinator)
		{
			m_discoveryCoordinator->RequestShutdown();
		}
		if (m_downloadCoordinator)
		{
			m_downloadCoordinator->RequestShutdown();
		}
	}
}

void ChannelGet::ShutdownCoordinators()
{
	Guard guard(m_coordinatorMutex);
	m_stopped = true;
	info("Stopping, waiting for running jobs to complete");

	if (m_discoveryCoordinator)
	{
		m_discoveryCoordinator->RequestShutdown();
	}

	if (m_downloadCoordinator)
	{
		m_downloadCoordinator->RequestShutdown();
	}
}

void ChannelGet::Stop()
{
	m_shutdownWatcher.RequestShutdown();
}

int RunMain()
{
	g_ChannelGet = std::make_unique<ChannelGet>();
	int exitCode = g_ChannelGet->Run();
	g_ChannelGet.reset();
	return exitCode;
}

void ExitProc()
{
	if (g_ChannelGet)
	{
		g_ChannelGet->Stop();
	}
}
