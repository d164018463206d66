/*
 *  This file is part of channelget.
 *
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

#include "FixtureLister.h"
#include "YtDlpLister.h"
#include "Options.h"
#include "TestUtil.h"

TEST_CASE("FixtureLister: listing", "[SourceLister][Quick]")
{
	FixtureLister lister;
	std::string filename = TestUtil::TestDataDir() + "/alpha.listing";

	SourceItemList items;
	CString errmsg;
	REQUIRE(lister.List(filename.c_str(), 0, items, errmsg) == SourceLister::lsOk);
	REQUIRE(items.size() == 5);
	REQUIRE(!strcmp(items[0].GetId(), "v5"));
	REQUIRE(!strcmp(items[0].GetTitle(), "Video 5"));
	REQUIRE(!strcmp(items[0].GetUrl(), "https://www.youtube.com/watch?v=v5"));
	REQUIRE(!strcmp(items[3].GetUrl(), "v2"));
	REQUIRE(!strcmp(items[4].GetTitle(), "v1"));

	SourceItemList probe;
	REQUIRE(lister.List(("file://" + filename).c_str(), 2, probe, errmsg) == SourceLister::lsOk);
	REQUIRE(probe.size() == 2);
	REQUIRE(!strcmp(probe[1].GetId(), "v4"));
}

TEST_CASE("FixtureLister: failures", "[SourceLister][Quick]")
{
	FixtureLister lister;
	SourceItemList items;
	CString errmsg;

	std::string throttled = TestUtil::TestDataDir() + "/throttled.listing";
	REQUIRE(lister.List(throttled.c_str(), 0, items, errmsg) == SourceLister::lsTransient);
	REQUIRE(items.empty());
	REQUIRE(!strcmp(errmsg, "HTTP Error 429: Too Many Requests"));

	std::string missing = TestUtil::TestDataDir() + "/missing.listing";
	REQUIRE(lister.List(missing.c_str(), 0, items, errmsg) == SourceLister::lsPermanent);
}

TEST_CASE("YtDlpLister: ClassifyError", "[SourceLister][Quick]")
{
	REQUIRE(YtDlpLister::ClassifyError("[youtube:tab] @nobody: This channel does not exist.") == SourceLister::lsPermanent);
	REQUIRE(YtDlpLister::ClassifyError("Unsupported URL: https://example.com/") == SourceLister::lsPermanent);
	REQUIRE(YtDlpLister::ClassifyError("Unable to download API page: HTTP Error 404: Not Found") == SourceLister::lsPermanent);
	REQUIRE(YtDlpLister::ClassifyError("Unable to download webpage: HTTP Error 429: Too Many Requests") == SourceLister::lsTransient);
	REQUIRE(YtDlpLister::ClassifyError("Unable to download webpage: <urlopen error timed out>") == SourceLister::lsTransient);
	REQUIRE(YtDlpLister::ClassifyError(nullptr) == SourceLister::lsTransient);
}

TEST_CASE("YtDlpLister: command line", "[SourceLister][Quick]")
{
	Options::CmdOptList cmdOpts;
	cmdOpts.push_back("YtDlpCmd=python3 -m yt_dlp");
	cmdOpts.push_back("ExtractorArgs=youtube:player_client=web");
	Options options(&cmdOpts);

	SourceItemList items;
	ListingProcess process(items);
	process.BuildArgs("https://www.youtube.com/@alpha/videos", 5);

	ProcessController::ArgList& args = process.GetArgs();
	REQUIRE(args.size() == 12);
	REQUIRE(!strcmp(args[0], "python3"));
	REQUIRE(!strcmp(args[1], "-m"));
	REQUIRE(!strcmp(args[2], "yt_dlp"));
	REQUIRE(!strcmp(args[3], "--flat-playlist"));
	REQUIRE(!strcmp(args[7], "--playlist-items"));
	REQUIRE(!strcmp(args[8], "1:5"));
	REQUIRE(!strcmp(args[9], "--extractor-args"));
	REQUIRE(!strcmp(args[10], "youtube:player_client=web"));
	REQUIRE(!strcmp(args[11], "https://www.youtube.com/@alpha/videos"));

	SourceItemList items2;
	ListingProcess fullListing(items2);
	fullListing.BuildArgs("https://www.youtube.com/@alpha/videos", 0);
	REQUIRE(fullListing.GetArgs().size() == 10);
}
