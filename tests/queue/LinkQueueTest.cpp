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

#include "LinkQueue.h"
#include "FileSystem.h"
#include "TestUtil.h"

static ItemDescriptor MakeItem(const char* channel, const char* id, int ordinal)
{
	ItemDescriptor item(channel, id, CString::FormatStr("Video %s", id),
		CString::FormatStr("https://www.youtube.com/watch?v=%s", id));
	item.SetOrdinal(ordinal);
	item.SetTargetFolder(channel);
	return item;
}

/*
Answers the duplicate checks of Enqueue as they were before another process
queued or broke the same entry.
 */
class LateCheckQueue : public LinkQueue
{
public:
	LateCheckQueue(const char* queueDir) : LinkQueue(queueDir) {}
	int staleChecks = 2;

	virtual bool Exists(const char* name)
	{
		return staleChecks-- > 0 ? false : LinkQueue::Exists(name);
	}

	virtual bool IsBroken(const char* name)
	{
		return staleChecks-- > 0 ? false : LinkQueue::IsBroken(name);
	}
};

TEST_CASE("LinkQueue: EntryName", "[LinkQueue][Quick]")
{
	CString name = LinkQueue::EntryName("alpha", "v1");
	REQUIRE(name.Length() == LinkQueue::ENTRY_NAME_LEN);
	REQUIRE(!strcmp(name, LinkQueue::EntryName("alpha", "v1")));
	REQUIRE(strcmp(name, LinkQueue::EntryName("alpha", "v2")));
	REQUIRE(strcmp(name, LinkQueue::EntryName("beta", "v1")));

	ItemDescriptor item = MakeItem("alpha", "v1", 1);
	REQUIRE(!strcmp(item.GetEntryName(), name));
}

TEST_CASE("LinkQueue: enqueue and load", "[LinkQueue][Quick]")
{
	TestUtil::PrepareWorkingDir();
	LinkQueue queue(TestUtil::WorkingDir().c_str());

	ItemDescriptor item = MakeItem("alpha", "v4", 4);
	item.SetTitle("Two\nlines");
	item.SetMaxHeight(720);
	item.SetSubtitleLanguages("pl,en");
	item.SetBrowserProfile("firefox");
	item.SetSymlinkDir("/srv/latest");

	CString errmsg;
	REQUIRE(queue.Enqueue(item, errmsg) == LinkQueue::erCreated);
	REQUIRE(queue.Enqueue(item, errmsg) == LinkQueue::erExists);
	REQUIRE(TestUtil::CountFiles(TestUtil::WorkingDir(), ".link") == 1);
	REQUIRE(TestUtil::CountFiles(TestUtil::WorkingDir(), ".new") == 0);

	LinkQueue::NameList pending = queue.ListPending();
	REQUIRE(pending.size() == 1);
	REQUIRE(!strcmp(pending[0], item.GetEntryName()));

	ItemDescriptor loaded;
	REQUIRE(queue.Load(pending[0], loaded, errmsg));
	REQUIRE(!strcmp(loaded.GetChannel(), "alpha"));
	REQUIRE(!strcmp(loaded.GetId(), "v4"));
	REQUIRE(!strcmp(loaded.GetTitle(), "Two lines"));
	REQUIRE(!strcmp(loaded.GetUrl(), "https://www.youtube.com/watch?v=v4"));
	REQUIRE(loaded.GetOrdinal() == 4);
	REQUIRE(loaded.GetMaxHeight() == 720);
	REQUIRE(!strcmp(loaded.GetTargetFolder(), "alpha"));
	REQUIRE(!strcmp(loaded.GetSubtitleLanguages(), "pl,en"));
	REQUIRE(!strcmp(loaded.GetBrowserProfile(), "firefox"));
	REQUIRE(!strcmp(loaded.GetSymlinkDir(), "/srv/latest"));
}

TEST_CASE("LinkQueue: invalid entries", "[LinkQueue][Quick]")
{
	TestUtil::PrepareWorkingDir();
	LinkQueue queue(TestUtil::WorkingDir().c_str());

	TestUtil::WriteFile(TestUtil::WorkingDir() + "/nourl.link",
		"channelget link file version 1\nchannel=alpha\nid=v1\n");
	TestUtil::WriteFile(TestUtil::WorkingDir() + "/garbage.link", "not a queue entry\n");

	ItemDescriptor item;
	CString errmsg;
	REQUIRE_FALSE(queue.Load("nourl", item, errmsg));
	REQUIRE(strstr(errmsg, "has no url"));
	REQUIRE_FALSE(queue.Load("garbage", item, errmsg));
	REQUIRE_FALSE(queue.Load("missing", item, errmsg));
	REQUIRE_FALSE(errmsg.Empty());

	LinkQueue missingDir((TestUtil::WorkingDir() + "/missing").c_str());
	ItemDescriptor item2 = MakeItem("alpha", "v1", 1);
	REQUIRE(missingDir.Enqueue(item2, errmsg) == LinkQueue::erFailed);
	REQUIRE_FALSE(errmsg.Empty());
}

TEST_CASE("LinkQueue: done and broken", "[LinkQueue][Quick]")
{
	TestUtil::PrepareWorkingDir();
	LinkQueue queue(TestUtil::WorkingDir().c_str());

	CString errmsg;
	ItemDescriptor item1 = MakeItem("alpha", "v1", 1);
	ItemDescriptor item2 = MakeItem("alpha", "v2", 2);
	REQUIRE(queue.Enqueue(item1, errmsg) == LinkQueue::erCreated);
	REQUIRE(queue.Enqueue(item2, errmsg) == LinkQueue::erCreated);
	REQUIRE(queue.ListPending().size() == 2);

	CString name1 = item1.GetEntryName();
	CString name2 = item2.GetEntryName();

	REQUIRE(queue.MarkDone(name1, errmsg));
	REQUIRE_FALSE(queue.Exists(name1));

	// second completion of the same entry finds nothing to do
	REQUIRE_FALSE(queue.MarkDone(name1, errmsg));
	REQUIRE(errmsg.Empty());

	REQUIRE(queue.MarkBroken(name2, errmsg));
	REQUIRE_FALSE(queue.Exists(name2));
	REQUIRE(queue.IsBroken(name2));
	REQUIRE(queue.ListPending().empty());
	REQUIRE(queue.ListBroken().size() == 1);

	// broken entries are not queued again
	REQUIRE(queue.Enqueue(item2, errmsg) == LinkQueue::erExists);
	REQUIRE_FALSE(queue.MarkBroken(name2, errmsg));
	REQUIRE(errmsg.Empty());
}

TEST_CASE("LinkQueue: ResolveEntry", "[LinkQueue][Quick]")
{
	LinkQueue queue("/srv/queue");
	REQUIRE(!strcmp(queue.ResolveEntry("0123456789abcdef0123"), "0123456789abcdef0123"));
	REQUIRE(!strcmp(queue.ResolveEntry("/srv/queue/0123456789abcdef0123.link"), "0123456789abcdef0123"));
	REQUIRE(!strcmp(queue.ResolveEntry("0123456789abcdef0123.broken"), "0123456789abcdef0123.broken"));
}

TEST_CASE("LinkQueue: concurrent enqueue", "[LinkQueue][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string queueDir = TestUtil::WorkingDir();
	LinkQueue queue(queueDir.c_str());
	LateCheckQueue lateQueue(queueDir.c_str());

	CString errmsg;
	ItemDescriptor item = MakeItem("alpha", "v1", 1);
	CString name = item.GetEntryName();
	std::string filename = queueDir + "/" + name.Str() + ".link";

	SECTION("queued by another producer")
	{
		REQUIRE(queue.Enqueue(item, errmsg) == LinkQueue::erCreated);
		std::string content = TestUtil::ReadFile(filename);

		ItemDescriptor again = MakeItem("alpha", "v1", 7);
		REQUIRE(lateQueue.Enqueue(again, errmsg) == LinkQueue::erExists);
		REQUIRE(TestUtil::ReadFile(filename) == content);
		REQUIRE(queue.ListPending().size() == 1);
	}

	SECTION("marked broken by a consumer")
	{
		REQUIRE(queue.Enqueue(item, errmsg) == LinkQueue::erCreated);
		REQUIRE(queue.MarkBroken(name, errmsg));

		REQUIRE(lateQueue.Enqueue(item, errmsg) == LinkQueue::erExists);
		REQUIRE_FALSE(queue.Exists(name));
		REQUIRE(queue.IsBroken(name));
		REQUIRE(queue.ListPending().empty());
	}
}
