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

#include "ShutdownWatcher.h"
#include "Util.h"

static bool WaitForCount(std::atomic<int>& counter, int expected)
{
	for (int i = 0; i < 200 && counter < expected; i++)
	{
		Util::Sleep(10);
	}
	return counter == expected;
}

static void StopAndJoin(ShutdownWatcher& watcher)
{
	watcher.Stop();
	while (watcher.IsRunning())
	{
		Util::Sleep(10);
	}
}

TEST_CASE("ShutdownWatcher: runs shutdown once", "[ShutdownWatcher][Quick]")
{
	std::atomic<int> calls{0};
	ShutdownWatcher watcher([&]{ calls++; }, 10);
	watcher.Start();

	Util::Sleep(30);
	REQUIRE(calls.load() == 0);
	REQUIRE_FALSE(watcher.GetRequested());

	watcher.RequestShutdown();
	REQUIRE(watcher.GetRequested());
	REQUIRE(WaitForCount(calls, 1));

	watcher.RequestShutdown();
	Util::Sleep(50);
	REQUIRE(calls.load() == 1);

	StopAndJoin(watcher);
}

TEST_CASE("ShutdownWatcher: request before start", "[ShutdownWatcher][Quick]")
{
	std::atomic<int> calls{0};
	ShutdownWatcher watcher([&]{ calls++; }, 10);
	watcher.RequestShutdown();
	REQUIRE(calls.load() == 0);

	watcher.Start();
	REQUIRE(WaitForCount(calls, 1));

	StopAndJoin(watcher);
}

TEST_CASE("ShutdownWatcher: stop without request", "[ShutdownWatcher][Quick]")
{
	std::atomic<int> calls{0};
	ShutdownWatcher watcher([&]{ calls++; }, 10000);
	watcher.Start();
	Util::Sleep(20);

	int64 start = Util::CurrentTicks();
	StopAndJoin(watcher);
	REQUIRE(Util::CurrentTicks() - start < 5000000);
	REQUIRE(calls.load() == 0);
}
