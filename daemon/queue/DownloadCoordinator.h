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


#ifndef DOWNLOADCOORDINATOR_H
#define DOWNLOADCOORDINATOR_H

#include "NString.h"
#include "Thread.h"
#include "Observer.h"
#include "LinkQueue.h"
#include "Downloader.h"

class DownloadProgress
{
public:
	DownloadProgress(ItemDescriptor* item, int percent) : m_item(item), m_percent(percent) {}
	ItemDescriptor* GetItem() { return m_item; }
	int GetPercent() { return m_percent; }

private:
	ItemDescriptor* m_item;
	int m_percent;
};

class DownloadSummary
{
public:
	int GetDone() { return m_done; }
	int GetBroken() { return m_broken; }
	int GetFailed() { return m_failed; }
	int GetSkipped() { return m_skipped; }
	int GetPending() { return m_pending; }
	int64 GetElapsed() { return m_elapsed; }

private:
	int m_done = 0;
	int m_broken = 0;
	int m_failed = 0;
	int m_skipped = 0;
	int m_pending = 0;
	int64 m_elapsed = 0;

	friend class DownloadCoordinator;
};

/*
Drains the link queue with a fixed number of worker threads. Each entry is
claimed by one worker only; after a successful download it is removed, after
a permanent failure it is marked broken, after a temporary failure it stays
pending for the next run. Observers receive "DownloadProgress" from the
worker threads.
 */
class DownloadCoordinator : public Subject
{
public:
	enum EResult
	{
		drDone,
		drBroken,
		drFailed,
		drSkipped
	};

	DownloadCoordinator(LinkQueue* linkQueue, Downloader* downloader, const char* destDir) :
		m_linkQueue(linkQueue), m_downloader(downloader), m_destDir(destDir) {}
	void SetWorkers(int workers) { m_workers = workers; }

	/* Processes all entries pending at start or added while running */
	DownloadSummary Run();

	/* Downloads one entry in the calling thread, "nameOrPath" as accepted by LinkQueue::ResolveEntry */
	EResult DownloadOne(const char* nameOrPath);

	/* No new entries are claimed, downloads in progress are completed */
	void RequestShutdown();
	bool IsShutdownRequested() { return m_shutdown; }

private:
	class DownloadWorker : public Thread
	{
	public:
		DownloadWorker(DownloadCoordinator* owner, int number) : m_owner(owner), m_number(number) {}

	protected:
		virtual void Run();

	private:
		DownloadCoordinator* m_owner;
		int m_number;
	};

	struct NameLess
	{
		bool operator()(const CString& a, const CString& b) const { return strcmp(a.Str(), b.Str()) < 0; }
	};

	typedef std::set<CString, NameLess> ClaimSet;
	typedef std::deque<CString> NameQueue;

	LinkQueue* m_linkQueue;
	Downloader* m_downloader;
	CString m_destDir;
	int m_workers = 3;
	std::atomic<bool> m_shutdown{false};
	Mutex m_claimMutex;
	ClaimSet m_claimed;
	NameQueue m_candidates;
	Mutex m_summaryMutex;
	DownloadSummary m_summary;

	bool Claim(CString& name);
	EResult ProcessEntry(const char* name);
	void WorkerLoop(int number);
	void AddResult(EResult result);
};

#endif
