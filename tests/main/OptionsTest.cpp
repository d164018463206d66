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

#include "catch.hpp"

#include "Options.h"

TEST_CASE("Options: initializing without configuration file", "[Options][Quick]")
{
	Options options(nullptr);

	REQUIRE(options.GetConfigFilename() == nullptr);
	REQUIRE(strcmp(options.GetTempDir(), "~/channelget/tmp") == 0);
	REQUIRE(strcmp(options.GetQueueDir(), "~/channelget/queue") == 0);
	REQUIRE(options.GetDiscoveryWorkers() == 5);
	REQUIRE(options.GetDownloadWorkers() == 3);
	REQUIRE(options.GetMaxRetries() == 3);
	REQUIRE(options.GetRetryDelay() == 1000);
	REQUIRE(options.GetProbeItems() == 5);
	REQUIRE(options.GetLister() == Options::lsYtDlp);
	REQUIRE(options.GetDownloader() == Options::dlYtDlp);
	REQUIRE(strcmp(options.GetYtDlpCmd(), "yt-dlp") == 0);
	REQUIRE(options.GetConfigErrors() == false);
}

TEST_CASE("Options: passing command line options", "[Options][Quick]")
{
	Options::CmdOptList cmdOpts;
	cmdOpts.push_back("DiscoveryWorkers=2");
	cmdOpts.push_back("DiscoveryWorkers=8");
	cmdOpts.push_back("MainDir=/srv/media");
	cmdOpts.push_back("Lister=fixture");
	cmdOpts.push_back("Downloader=fixture");

	Options options(&cmdOpts);

	REQUIRE(options.GetConfigFilename() == nullptr);
	REQUIRE(options.GetDiscoveryWorkers() == 8);
	REQUIRE(strcmp(options.GetMainDir(), "/srv/media") == 0);
	REQUIRE(strcmp(options.GetChannelDir(), "/srv/media/channels") == 0);
	REQUIRE(strcmp(options.GetDestDir(), "/srv/media/videos") == 0);
	REQUIRE(options.GetLister() == Options::lsFixture);
	REQUIRE(options.GetDownloader() == Options::dlFixture);
}

TEST_CASE("Options: option names are case insensitive", "[Options][Quick]")
{
	Options::CmdOptList cmdOpts;
	cmdOpts.push_back("maxretries=7");
	cmdOpts.push_back("RETRYDELAY=250");

	Options options(&cmdOpts);

	REQUIRE(options.GetMaxRetries() == 7);
	REQUIRE(options.GetRetryDelay() == 250);
}

TEST_CASE("Options: invalid values", "[Options][Quick]")
{
	Options::CmdOptList cmdOpts;
	cmdOpts.push_back("DiscoveryWorkers=0");
	cmdOpts.push_back("Lister=carrier-pigeon");

	Options options(&cmdOpts);

	REQUIRE(options.GetConfigErrors() == true);
}

TEST_CASE("Options: splitting option string", "[Options][Quick]")
{
	CString name;
	CString value;

	REQUIRE(Options::SplitOptionString("source_url = https://example.com/a=b", name, value));
	REQUIRE(strcmp(name, "source_url") == 0);
	REQUIRE(strcmp(value, "https://example.com/a=b") == 0);

	REQUIRE_FALSE(Options::SplitOptionString("no separator here", name, value));
}
