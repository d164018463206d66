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
#include "DiscoveryCoordinator.h"
#include "Log.h"
#include "Util.h"

bool SystemRetryTimer::Sleep(int msec)
{
	Guard guard(m_mutex);
	return !m_waitCond.WaitFor(m_mutex, msec, [&]{ return m_interrupted; });
}

void SystemRetryTimer::Interrupt()
{
	Guard guard(m_mutex);
	m_interrupted = true;
	m_waitCond.NotifyAll();
}

DiscoverySummary::DiscoverySummary(ChannelResultList& results, int64 elapsed) :
	m_elapsed(elapsed)
{
	for (ChannelResult& result : results)
	{
		m_total++;
		m_retries += result.GetRetryCount();
		m_newItems += result.GetNewItemCount();
		if (result.GetSuccess())
		{
			m_succeeded++;
		}
		else if (result.GetErrorKind() == ChannelResult::ekCancelled)
		{
			m_cancelled++;
		}
		else
		{
			m_failed++;
		}
	}
}

DiscoveryCoordinator::DiscoveryCoordinator(DiscoveryEngine* engine, RetryTimer* retryTimer) :
	m_engine(engine), m_retryTimer(retryTimer)
{
	if (!m_retryTimer)
	{
		m_ownTimer = std::make_unique<SystemRetryTimer>();
		m_retryTimer = m_ownTimer.get();
	}
}

int DiscoveryCoordinator::BackoffDelay(int retryDelay, int retry)
{
	int64 delay = retryDelay;
	for (int i = 1; i < retry && delay < INT_MAX; i++)
	{
		delay *= 2;
	}
	return (int)std::min(delay, (int64)INT_MAX);
}

void DiscoveryCoordinator::RequestShutdown()
{
	debug("Discovery shutdown requested");
	m_shutdown = true;
	m_retryTimer->Interrupt();
}

ChannelResultList DiscoveryCoordinator::FetchAll(ChannelList& channels)
{
	int64 startTicks = Util::CurrentTicks();
	int total = (int)channels.size();

	m_channels = &channels;
	m_results.clear();
	m_results.resize(total);
	m_nextChannel = 0;
	m_completed = 0;

	int workerCount = std::min(m_workers, total);
	info("Discovering %i channel(s) with %i worker(s)", total, workerCount);

	std::vector<std::unique_ptr<DiscoveryWorker>> workers;
	for (int i = 0; i < workerCount; i++)
	{
		workers.push_back(std::make_unique<DiscoveryWorker>(this, i + 1));
		workers.back()->Start();
	}

	// workers finish in-flight channels even after a shutdown request
	for (std::unique_ptr<DiscoveryWorker>& worker : workers)
	{
		while (worker->IsRunning())
		{
			Util::Sleep(20);
		}
	}

	ChannelResultList results;
	for (int i = 0; i < total; i++)
	{
		if (m_results[i])
		{
			results.push_back(std::move(*m_results[i]));
		}
		else
		{
			ChannelResult cancelled(channels[i]->GetName());
			cancelled.SetError(ChannelResult::ekCancelled, "cancelled");
			results.push_back(std::move(cancelled));
		}
	}

	m_results.clear();
	m_channels = nullptr;
	m_elapsed = (Util::CurrentTicks() - startTicks) / 1000;

	return results;
}

void DiscoveryCoordinator::DiscoveryWorker::Run()
{
	m_owner->WorkerLoop(m_number);
}

void DiscoveryCoordinator::WorkerLoop(int number)
{
	debug("Discovery worker %i started", number);

	int index;
	while (ChannelConfig* channel = ClaimChannel(index))
	{
		ChannelSettled(index, ProcessChannel(*channel));
	}

	debug("Discovery worker %i finished", number);
}

ChannelConfig* DiscoveryCoordinator::ClaimChannel(int& index)
{
	Guard guard(m_resultsMutex);

	if (m_shutdown || m_nextChannel >= (int)m_channels->size())
	{
		return nullptr;
	}

	index = m_nextChannel++;
	return (*m_channels)[index].get();
}

void DiscoveryCoordinator::ChannelSettled(int index, ChannelResult&& result)
{
	Guard guard(m_resultsMutex);

	m_results[index] = std::make_unique<ChannelResult>(std::move(result));
	m_completed++;

	DiscoveryProgress progress(m_completed, (int)m_channels->size(), m_results[index].get());
	Notify(&progress);
}

ChannelResult DiscoveryCoordinator::ProcessChannel(ChannelConfig& channel)
{
	int64 startTicks = Util::CurrentTicks();
	int retries = 0;

	while (true)
	{
		ChannelResult result = m_engine->Discover(channel);

		bool retry = result.GetErrorKind() == ChannelResult::ekTransient &&
			retries < m_maxRetries && !m_shutdown;

		if (retry)
		{
			int delay = BackoffDelay(m_retryDelay, retries + 1);
			warn("Discovery of %s failed: %s; retry %i of %i in %s", channel.GetName(),
				result.GetError(), retries + 1, m_maxRetries, *Util::FormatDuration(delay));
			retry = m_retryTimer->Sleep(delay) && !m_shutdown;
		}

		if (!retry)
		{
			if (!result.GetSuccess())
			{
				error("Discovery of %s failed: %s", channel.GetName(), result.GetError());
			}
			result.SetRetryCount(retries);
			result.SetDuration((Util::CurrentTicks() - startTicks) / 1000);
			return result;
		}

		retries++;
	}
}
