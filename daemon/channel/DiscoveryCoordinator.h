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


#ifndef DISCOVERYCOORDINATOR_H
#define DISCOVERYCOORDINATOR_H

#include "NString.h"
#include "Thread.h"
#include "Observer.h"
#include "DiscoveryEngine.h"

/*
Waits between retries. Replaceable to run the retry logic on a virtual clock.
 */
class RetryTimer
{
public:
	virtual ~RetryTimer() {}
	/* Returns false if the wait was interrupted */
	virtual bool Sleep(int msec) = 0;
	virtual void Interrupt() = 0;
};

class SystemRetryTimer : public RetryTimer
{
public:
	virtual bool Sleep(int msec);
	virtual void Interrupt();

private:
	Mutex m_mutex;
	ConditionVar m_waitCond;
	bool m_interrupted = false;
};

class DiscoveryProgress
{
public:
	DiscoveryProgress(int completed, int total, ChannelResult* result) :
		m_completed(completed), m_total(total), m_result(result) {}
	int GetCompleted() { return m_completed; }
	int GetTotal() { return m_total; }
	ChannelResult* GetResult() { return m_result; }

private:
	int m_completed;
	int m_total;
	ChannelResult* m_result;
};

class DiscoverySummary
{
public:
	DiscoverySummary(ChannelResultList& results, int64 elapsed);
	int GetTotal() { return m_total; }
	int GetSucceeded() { return m_succeeded; }
	int GetFailed() { return m_failed; }
	int GetCancelled() { return m_cancelled; }
	int GetNewItems() { return m_newItems; }
	int GetRetries() { return m_retries; }
	int64 GetElapsed() { return m_elapsed; }

private:
	int m_total = 0;
	int m_succeeded = 0;
	int m_failed = 0;
	int m_cancelled = 0;
	int m_newItems = 0;
	int m_retries = 0;
	int64 m_elapsed;
};

/*
Runs the discovery of many channels on a fixed number of worker threads.
Observers receive a "DiscoveryProgress" after each channel is settled,
called from the worker threads one at a time.
 */
class DiscoveryCoordinator : public Subject
{
public:
	DiscoveryCoordinator(DiscoveryEngine* engine, RetryTimer* retryTimer = nullptr);
	void SetWorkers(int workers) { m_workers = workers; }
	void SetMaxRetries(int maxRetries) { m_maxRetries = maxRetries; }
	void SetRetryDelay(int retryDelay) { m_retryDelay = retryDelay; }

	/*
	Discovers all channels and returns their results in the order of "channels".
	After a shutdown request channels not yet started get a cancelled result.
	 */
	ChannelResultList FetchAll(ChannelList& channels);
	void RequestShutdown();
	bool IsShutdownRequested() { return m_shutdown; }
	int64 GetElapsed() { return m_elapsed; }

	/* Delay before the retry number "retry" (counting from 1) */
	static int BackoffDelay(int retryDelay, int retry);

private:
	class DiscoveryWorker : public Thread
	{
	public:
		DiscoveryWorker(DiscoveryCoordinator* owner, int number) : m_owner(owner), m_number(number) {}

	protected:
		virtual void Run();

	private:
		DiscoveryCoordinator* m_owner;
		int m_number;
	};

	typedef std::vector<std::unique_ptr<ChannelResult>> ResultSlots;

	DiscoveryEngine* m_engine;
	RetryTimer* m_retryTimer;
	std::unique_ptr<RetryTimer> m_ownTimer;
	int m_workers = 5;
	int m_maxRetries = 3;
	int m_retryDelay = 1000;
	std::atomic<bool> m_shutdown{false};
	ChannelList* m_channels = nullptr;
	ResultSlots m_results;
	Mutex m_resultsMutex;
	int m_nextChannel = 0;
	int m_completed = 0;
	int64 m_elapsed = 0;

	ChannelConfig* ClaimChannel(int& index);
	void ChannelSettled(int index, ChannelResult&& result);
	ChannelResult ProcessChannel(ChannelConfig& channel);
	void WorkerLoop(int number);
};

#endif
