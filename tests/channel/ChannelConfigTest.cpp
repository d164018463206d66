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

#include "ChannelConfig.h"
#include "FileSystem.h"
#include "TestUtil.h"

TEST_CASE("ChannelConfig: load", "[ChannelConfig][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string filename = TestUtil::WorkingDir() + "/alpha.conf";
	TestUtil::WriteFile(filename,
		"# Alpha channel\n"
		"source_url = \"https://www.youtube.com/@alpha/videos\"\n"
		"target_folder = 'Alpha'\n"
		"max_height = 720\n"
		"subtitle_languages = [\"pl\", \"en\"]\n"
		"browser_profile = firefox\n"
		"last_item_id = v3\n"
		"last_download_index = 3\n");

	ChannelConfig channel(filename.c_str());
	REQUIRE(!strcmp(channel.GetName(), "alpha"));
	REQUIRE(channel.Load() == ChannelConfig::clLoaded);
	REQUIRE(!strcmp(channel.GetSourceUrl(), "https://www.youtube.com/@alpha/videos"));
	REQUIRE(!strcmp(channel.GetTargetFolder(), "Alpha"));
	REQUIRE(channel.GetMaxHeight() == 720);
	REQUIRE(channel.GetSubtitleLanguages()->size() == 2);
	REQUIRE(!strcmp(channel.FormatSubtitleLanguages(), "pl,en"));
	REQUIRE(!strcmp(channel.GetBrowserProfile(), "firefox"));
	REQUIRE(channel.GetSymlinkDir() == nullptr);
	REQUIRE(!strcmp(channel.GetLastItemId(), "v3"));
	REQUIRE(channel.GetLastDownloadIndex() == 3);
}

TEST_CASE("ChannelConfig: defaults and legacy keys", "[ChannelConfig][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string filename = TestUtil::WorkingDir() + "/beta.conf";
	TestUtil::WriteFile(filename,
		"link=https://www.youtube.com/@beta\n"
		"last_video=abc\n");

	ChannelConfig channel(filename.c_str());
	REQUIRE(channel.Load() == ChannelConfig::clLoaded);
	REQUIRE(!strcmp(channel.GetSourceUrl(), "https://www.youtube.com/@beta"));
	REQUIRE(channel.GetTargetFolder() == nullptr);
	REQUIRE(channel.GetMaxHeight() == ChannelConfig::DEFAULT_MAX_HEIGHT);
	REQUIRE(channel.GetSubtitleLanguages()->empty());
	REQUIRE(!strcmp(channel.GetLastItemId(), "abc"));
	REQUIRE(channel.GetLastDownloadIndex() == 0);
}

TEST_CASE("ChannelConfig: invalid documents", "[ChannelConfig][Quick]")
{
	TestUtil::PrepareWorkingDir();

	std::string notChannel = TestUtil::WorkingDir() + "/settings.conf";
	TestUtil::WriteFile(notChannel, "# nothing here\ntheme=dark\n");
	ChannelConfig settings(notChannel.c_str());
	REQUIRE(settings.Load() == ChannelConfig::clNotChannel);

	std::string badNumber = TestUtil::WorkingDir() + "/gamma.conf";
	TestUtil::WriteFile(badNumber, "source_url=https://example.com/gamma\nmax_height=tall\n");
	ChannelConfig gamma(badNumber.c_str());
	REQUIRE(gamma.Load() == ChannelConfig::clError);
	REQUIRE(strstr(gamma.GetErrMsg(), "max_height"));

	std::string badLine = TestUtil::WorkingDir() + "/delta.conf";
	TestUtil::WriteFile(badLine, "source_url=https://example.com/delta\njust some words\n");
	ChannelConfig delta(badLine.c_str());
	REQUIRE(delta.Load() == ChannelConfig::clError);
	REQUIRE(strstr(delta.GetErrMsg(), "delta.conf(2)"));

	ChannelConfig missing((TestUtil::WorkingDir() + "/missing.conf").c_str());
	REQUIRE(missing.Load() == ChannelConfig::clError);
}

TEST_CASE("ChannelConfig: advance and save", "[ChannelConfig][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string filename = TestUtil::WorkingDir() + "/alpha.conf";
	TestUtil::WriteFile(filename,
		"# keep me\n"
		"source_url=https://www.youtube.com/@alpha\n"
		"target_folder=Alpha\n"
		"custom_key=custom value\n"
		"last_item_id=v3\n"
		"last_download_index=3\n");

	ChannelConfig channel(filename.c_str());
	REQUIRE(channel.Load() == ChannelConfig::clLoaded);

	channel.Advance("v9", 0);
	REQUIRE(!strcmp(channel.GetLastItemId(), "v3"));
	REQUIRE(channel.GetLastDownloadIndex() == 3);

	channel.Advance("v5", 2);
	REQUIRE(channel.Save());
	REQUIRE_FALSE(FileSystem::FileExists((filename + ".new").c_str()));

	std::string content = TestUtil::ReadFile(filename);
	REQUIRE(content.find("# keep me\n") != std::string::npos);
	REQUIRE(content.find("custom_key=custom value\n") != std::string::npos);

	ChannelConfig reloaded(filename.c_str());
	REQUIRE(reloaded.Load() == ChannelConfig::clLoaded);
	REQUIRE(!strcmp(reloaded.GetLastItemId(), "v5"));
	REQUIRE(reloaded.GetLastDownloadIndex() == 5);
	REQUIRE(!strcmp(reloaded.GetTargetFolder(), "Alpha"));
}

TEST_CASE("ChannelLoader: LoadAll", "[ChannelConfig][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string dir = TestUtil::WorkingDir();
	TestUtil::WriteFile(dir + "/zulu.conf", "source_url=https://example.com/zulu\ntarget_folder=Zulu\n");
	TestUtil::WriteFile(dir + "/alpha.conf", "source_url=https://example.com/alpha\ntarget_folder=Alpha\n");
	TestUtil::WriteFile(dir + "/broken.conf", "source_url=https://example.com/broken\nmax_height=-1\n");
	TestUtil::WriteFile(dir + "/settings.conf", "theme=dark\n");
	TestUtil::WriteFile(dir + "/notes.txt", "source_url=https://example.com/notes\n");

	ChannelList channels;
	REQUIRE(ChannelLoader::LoadAll(dir.c_str(), channels));
	REQUIRE(channels.size() == 3);
	REQUIRE(!strcmp(channels[0]->GetName(), "alpha"));
	REQUIRE(!strcmp(channels[1]->GetName(), "broken"));
	REQUIRE(!strcmp(channels[2]->GetName(), "zulu"));

	ChannelList none;
	REQUIRE_FALSE(ChannelLoader::LoadAll((dir + "/missing").c_str(), none));
}
