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

#include "DiscoveryEngine.h"
#include "FileSystem.h"
#include "TestUtil.h"

class ScriptedLister : public SourceLister
{
public:
	std::vector<CString> ids;
	EStatus status = lsOk;
	std::vector<int> requests;

	virtual EStatus List(const char* sourceUrl, int maxItems, SourceItemList& items, CString& errmsg)
	{
		requests.push_back(maxItems);
		if (status != lsOk)
		{
			errmsg = "listing failed";
			return status;
		}
		for (CString& id : ids)
		{
			if (maxItems > 0 && (int)items.size() >= maxItems)
			{
				break;
			}
			items.emplace_back(id, CString::FormatStr("Video %s", *id),
				CString::FormatStr("https://www.youtube.com/watch?v=%s", *id));
		}
		return lsOk;
	}
};

class DiscoveryFixture
{
public:
	std::string channelFile;
	std::string queueDir;

	DiscoveryFixture(const char* marker = nullptr, int index = 0)
	{
		TestUtil::PrepareWorkingDir();
		channelFile = TestUtil::WorkingDir() + "/alpha.conf";
		queueDir = TestUtil::WorkingDir() + "/queue";
		FileSystem::CreateDirectory(queueDir.c_str());

		std::string content = "source_url=https://www.youtube.com/@alpha/videos\ntarget_folder=Alpha\n";
		if (marker)
		{
			content += std::string("last_item_id=") + marker + "\n";
			content += "last_download_index=" + std::to_string(index) + "\n";
		}
		TestUtil::WriteFile(channelFile, content);
	}

	std::vector<int> QueuedOrdinals(LinkQueue& queue, std::vector<CString>& ids)
	{
		std::vector<int> ordinals;
		for (CString& name : queue.ListPending())
		{
			ItemDescriptor item;
			CString errmsg;
			REQUIRE(queue.Load(name, item, errmsg));
			ordinals.push_back(item.GetOrdinal());
			ids.push_back(item.GetId());
		}
		return ordinals;
	}
};

static ChannelConfig::NameList Ids(std::initializer_list<const char*> ids)
{
	ChannelConfig::NameList list;
	for (const char* id : ids)
	{
		list.emplace_back(id);
	}
	return list;
}

TEST_CASE("DiscoveryEngine: CountNew", "[DiscoveryEngine][Quick]")
{
	SourceItemList listing;
	for (const char* id : {"v5", "v4", "v3", "v2", "v1"})
	{
		listing.emplace_back(id, id, id);
	}

	bool markerFound;
	REQUIRE(DiscoveryEngine::CountNew(listing, "v3", 3, markerFound) == 2);
	REQUIRE(markerFound);
	REQUIRE(DiscoveryEngine::CountNew(listing, "v5", 5, markerFound) == 0);
	REQUIRE(markerFound);
	REQUIRE(DiscoveryEngine::CountNew(listing, "gone", 7, markerFound) == 5);
	REQUIRE_FALSE(markerFound);
	REQUIRE(DiscoveryEngine::CountNew(listing, nullptr, 0, markerFound) == 5);
	REQUIRE(DiscoveryEngine::CountNew(listing, "", 3, markerFound) == 2);
	REQUIRE(DiscoveryEngine::CountNew(listing, "", 9, markerFound) == 0);
	REQUIRE_FALSE(markerFound);

	SourceItemList empty;
	REQUIRE(DiscoveryEngine::CountNew(empty, "v3", 3, markerFound) == 0);
}

TEST_CASE("DiscoveryEngine: new videos after marker", "[DiscoveryEngine][Quick]")
{
	DiscoveryFixture fixture("v3", 3);
	ScriptedLister lister;
	lister.ids = Ids({"v5", "v4", "v3", "v2", "v1"});
	LinkQueue queue(fixture.queueDir.c_str());
	DiscoveryEngine engine(&lister, &queue);

	ChannelConfig channel(fixture.channelFile.c_str());
	ChannelResult result = engine.Discover(channel);

	REQUIRE(result.GetSuccess());
	REQUIRE(result.GetNewItemCount() == 2);
	REQUIRE(!strcmp(result.GetChannelName(), "alpha"));

	// marker found within the probe, no full listing requested
	REQUIRE(lister.requests.size() == 1);
	REQUIRE(lister.requests[0] == 5);

	std::vector<CString> ids;
	std::vector<int> ordinals = fixture.QueuedOrdinals(queue, ids);
	REQUIRE(ordinals.size() == 2);
	for (int i = 0; i < 2; i++)
	{
		// v4 is the older one and gets the lower ordinal
		REQUIRE(ordinals[i] == (!strcmp(ids[i], "v4") ? 4 : 5));
	}

	ChannelConfig reloaded(fixture.channelFile.c_str());
	REQUIRE(reloaded.Load() == ChannelConfig::clLoaded);
	REQUIRE(!strcmp(reloaded.GetLastItemId(), "v5"));
	REQUIRE(reloaded.GetLastDownloadIndex() == 5);
}

TEST_CASE("DiscoveryEngine: first run and repeated runs", "[DiscoveryEngine][Quick]")
{
	DiscoveryFixture fixture;
	ScriptedLister lister;
	lister.ids = Ids({"v3", "v2", "v1"});
	LinkQueue queue(fixture.queueDir.c_str());
	DiscoveryEngine engine(&lister, &queue);

	ChannelConfig channel(fixture.channelFile.c_str());
	ChannelResult result = engine.Discover(channel);
	REQUIRE(result.GetSuccess());
	REQUIRE(result.GetNewItemCount() == 3);
	REQUIRE(lister.requests.size() == 1);
	REQUIRE(lister.requests[0] == 0);
	REQUIRE(queue.ListPending().size() == 3);
	REQUIRE(!strcmp(channel.GetLastItemId(), "v3"));
	REQUIRE(channel.GetLastDownloadIndex() == 3);

	// nothing changed at the source
	ChannelResult again = engine.Discover(channel);
	REQUIRE(again.GetSuccess());
	REQUIRE(again.GetNewItemCount() == 0);
	REQUIRE(queue.ListPending().size() == 3);
	REQUIRE(channel.GetLastDownloadIndex() == 3);

	// two more videos published, ordinals continue
	lister.ids = Ids({"v5", "v4", "v3", "v2", "v1"});
	ChannelResult later = engine.Discover(channel);
	REQUIRE(later.GetNewItemCount() == 2);
	REQUIRE(channel.GetLastDownloadIndex() == 5);

	std::vector<CString> ids;
	std::vector<int> ordinals = fixture.QueuedOrdinals(queue, ids);
	std::sort(ordinals.begin(), ordinals.end());
	REQUIRE(ordinals == std::vector<int>({1, 2, 3, 4, 5}));
}

TEST_CASE("DiscoveryEngine: interrupted batch", "[DiscoveryEngine][Quick]")
{
	DiscoveryFixture fixture;
	ScriptedLister lister;
	lister.ids = Ids({"v5", "v4", "v3", "v2", "v1"});
	LinkQueue queue(fixture.queueDir.c_str());

	// an earlier run queued the three oldest videos and stopped before saving the marker
	for (const char* id : {"v1", "v2", "v3"})
	{
		ItemDescriptor item("alpha", id, id, id);
		CString errmsg;
		REQUIRE(queue.Enqueue(item, errmsg) == LinkQueue::erCreated);
	}

	DiscoveryEngine engine(&lister, &queue);
	ChannelConfig channel(fixture.channelFile.c_str());
	ChannelResult result = engine.Discover(channel);

	REQUIRE(result.GetSuccess());
	REQUIRE(result.GetNewItemCount() == 5);
	REQUIRE(queue.ListPending().size() == 5);
	REQUIRE(!strcmp(channel.GetLastItemId(), "v5"));
	REQUIRE(channel.GetLastDownloadIndex() == 5);
}

TEST_CASE("DiscoveryEngine: marker outside of probe", "[DiscoveryEngine][Quick]")
{
	DiscoveryFixture fixture("v1", 1);
	ScriptedLister lister;
	lister.ids = Ids({"v5", "v4", "v3", "v2", "v1"});
	LinkQueue queue(fixture.queueDir.c_str());
	DiscoveryEngine engine(&lister, &queue);
	engine.SetProbeItems(2);

	ChannelConfig channel(fixture.channelFile.c_str());
	ChannelResult result = engine.Discover(channel);

	REQUIRE(result.GetSuccess());
	REQUIRE(result.GetNewItemCount() == 4);
	REQUIRE(lister.requests == std::vector<int>({2, 0}));
	REQUIRE(channel.GetLastDownloadIndex() == 5);
}

TEST_CASE("DiscoveryEngine: marker missing from listing", "[DiscoveryEngine][Quick]")
{
	DiscoveryFixture fixture("deleted", 4);
	ScriptedLister lister;
	lister.ids = Ids({"v3", "v2", "v1"});
	LinkQueue queue(fixture.queueDir.c_str());
	DiscoveryEngine engine(&lister, &queue);

	ChannelConfig channel(fixture.channelFile.c_str());
	ChannelResult result = engine.Discover(channel);

	// a short probe is the complete listing, all of it is new
	REQUIRE(lister.requests == std::vector<int>({5}));
	REQUIRE(result.GetSuccess());
	REQUIRE(result.GetNewItemCount() == 3);
	REQUIRE(!strcmp(channel.GetLastItemId(), "v3"));
	REQUIRE(channel.GetLastDownloadIndex() == 7);
}

TEST_CASE("DiscoveryEngine: channel defaults", "[DiscoveryEngine][Quick]")
{
	DiscoveryFixture fixture;
	TestUtil::WriteFile(fixture.channelFile,
		"source_url=https://www.youtube.com/@alpha/videos\n"
		"target_folder=Alpha\n"
		"max_height=480\n"
		"browser_profile=chromium\n");
	ScriptedLister lister;
	lister.ids = Ids({"v1"});
	LinkQueue queue(fixture.queueDir.c_str());
	DiscoveryEngine engine(&lister, &queue);
	engine.SetDefaultSubtitleLanguages("en");
	engine.SetDefaultBrowserProfile("firefox");
	engine.SetDefaultSymlinkDir("/srv/latest");

	ChannelConfig channel(fixture.channelFile.c_str());
	REQUIRE(engine.Discover(channel).GetSuccess());

	ItemDescriptor item;
	CString errmsg;
	REQUIRE(queue.Load(LinkQueue::EntryName("alpha", "v1"), item, errmsg));
	REQUIRE(item.GetMaxHeight() == 480);
	REQUIRE(!strcmp(item.GetTargetFolder(), "Alpha"));
	REQUIRE(!strcmp(item.GetSubtitleLanguages(), "en"));
	REQUIRE(!strcmp(item.GetBrowserProfile(), "chromium"));
	REQUIRE(!strcmp(item.GetSymlinkDir(), "/srv/latest"));
	REQUIRE(item.GetOrdinal() == 1);
}

TEST_CASE("DiscoveryEngine: failures", "[DiscoveryEngine][Quick]")
{
	DiscoveryFixture fixture("v3", 3);
	ScriptedLister lister;
	lister.ids = Ids({"v5", "v4", "v3"});
	LinkQueue queue(fixture.queueDir.c_str());
	DiscoveryEngine engine(&lister, &queue);
	ChannelConfig channel(fixture.channelFile.c_str());

	SECTION("transient listing error")
	{
		lister.status = SourceLister::lsTransient;
		ChannelResult result = engine.Discover(channel);
		REQUIRE(result.GetErrorKind() == ChannelResult::ekTransient);
		REQUIRE(!strcmp(result.GetError(), "listing failed"));
	}

	SECTION("permanent listing error")
	{
		lister.status = SourceLister::lsPermanent;
		REQUIRE(engine.Discover(channel).GetErrorKind() == ChannelResult::ekPermanent);
	}

	SECTION("missing target folder")
	{
		TestUtil::WriteFile(fixture.channelFile, "source_url=https://www.youtube.com/@alpha/videos\n");
		ChannelResult result = engine.Discover(channel);
		REQUIRE(result.GetErrorKind() == ChannelResult::ekConfig);
		REQUIRE(strstr(result.GetError(), "target_folder"));
		REQUIRE(lister.requests.empty());
	}

	SECTION("unreadable channel document")
	{
		TestUtil::WriteFile(fixture.channelFile, "source_url=x\nmax_height=-5\n");
		REQUIRE(engine.Discover(channel).GetErrorKind() == ChannelResult::ekConfig);
	}

	SECTION("queue not writable")
	{
		LinkQueue missingQueue((TestUtil::WorkingDir() + "/missing").c_str());
		DiscoveryEngine brokenEngine(&lister, &missingQueue);
		ChannelResult result = brokenEngine.Discover(channel);
		REQUIRE(result.GetErrorKind() == ChannelResult::ekPermanent);
	}

	// the marker stays where it was
	ChannelConfig reloaded(fixture.channelFile.c_str());
	reloaded.Load();
	REQUIRE(reloaded.GetLastDownloadIndex() != 5);
	REQUIRE(queue.ListPending().empty());
}
