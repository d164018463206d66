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
#include "DownloadCoordinator.h"
#include "FileSystem.h"
#include "Log.h"
#include "Util.h"

void DownloadCoordinator::RequestShutdown()
{
	debug("Download shutdown requested");
	m_shutdown = true;
}

DownloadSummary DownloadCoordinator::Run()
{
	int64 startTicks = Util::CurrentTicks();

	m_claimed.clear();
	m_candidates.clear();
	m_summary = DownloadSummary();

	LinkQueue::NameList pending = m_linkQueue->ListPending();
	if (pending.empty())
	{
		info("Nothing to download");
		return m_summary;
	}

	int workerCount = std::min(m_workers, (int)pending.size());
	info("Downloading %i queued video(s) with %i worker(s)", (int)pending.size(), workerCount);

	std::vector<std::unique_ptr<DownloadWorker>> workers;
	for (int i = 0; i < workerCount; i++)
	{
		workers.push_back(std::make_unique<DownloadWorker>(this, i + 1));
		workers.back()->Start();
	}

	for (std::unique_ptr<DownloadWorker>& worker : workers)
	{
		while (worker->IsRunning())
		{
			Util::Sleep(20);
		}
	}

	m_summary.m_pending = (int)m_linkQueue->ListPending().size();
	m_summary.m_elapsed = (Util::CurrentTicks() - startTicks) / 1000;

	return m_summary;
}

void DownloadCoordinator::DownloadWorker::Run()
{
	m_owner->WorkerLoop(m_number);
}

void DownloadCoordinator::WorkerLoop(int number)
{
	debug("Download worker %i started", number);

	CString name;
	while (Claim(name))
	{
		AddResult(ProcessEntry(name));
	}

	debug("Download worker %i finished", number);
}

bool DownloadCoordinator::Claim(CString& name)
{
	Guard guard(m_claimMutex);

	if (m_shutdown)
	{
		return false;
	}

	if (m_candidates.empty())
	{
		// entries queued meanwhile become visible with a new listing
		for (CString& pendingName : m_linkQueue->ListPending())
		{
			if (m_claimed.find(pendingName) == m_claimed.end())
			{
				m_candidates.push_back(std::move(pendingName));
			}
		}
	}

	while (!m_candidates.empty())
	{
		CString candidate = std::move(m_candidates.front());
		m_candidates.pop_front();
		if (m_claimed.insert(CString(*candidate)).second)
		{
			name = std::move(candidate);
			return true;
		}
	}

	return false;
}

void DownloadCoordinator::AddResult(EResult result)
{
	Guard guard(m_summaryMutex);

	switch (result)
	{
		case drDone: m_summary.m_done++; break;
		case drBroken: m_summary.m_broken++; break;
		case drFailed: m_summary.m_failed++; break;
		case drSkipped: m_summary.m_skipped++; break;
	}
}

DownloadCoordinator::EResult DownloadCoordinator::DownloadOne(const char* nameOrPath)
{
	CString name = m_linkQueue->ResolveEntry(nameOrPath);
	if (!m_linkQueue->Exists(name))
	{
		error("Queue entry %s not found in %s", nameOrPath, m_linkQueue->GetQueueDir());
		return drSkipped;
	}

	return ProcessEntry(name);
}

DownloadCoordinator::EResult DownloadCoordinator::ProcessEntry(const char* name)
{
	if (!m_linkQueue->Exists(name))
	{
		debug("Queue entry %s has gone, handled elsewhere", name);
		return drSkipped;
	}

	ItemDescriptor item;
	CString errmsg;
	if (!m_linkQueue->Load(name, item, errmsg))
	{
		if (!m_linkQueue->Exists(name))
		{
			debug("Queue entry %s has gone, handled elsewhere", name);
			return drSkipped;
		}

		error("Could not read queue entry %s: %s", name, *errmsg);
		if (!m_linkQueue->MarkBroken(name, errmsg) && !errmsg.Empty())
		{
			error("Could not mark queue entry %s as broken: %s", name, *errmsg);
		}
		return drBroken;
	}

	// an absolute target folder replaces the destination root
	BString<1024> destDir;
	if (FileSystem::IsAbsolutePath(item.GetTargetFolder()))
	{
		destDir = item.GetTargetFolder();
	}
	else
	{
		destDir.Format("%s%c%s", *m_destDir, PATH_SEPARATOR, item.GetTargetFolder());
	}
	if (!FileSystem::ForceDirectories(destDir, errmsg))
	{
		error("Could not create directory %s: %s", *destDir, *errmsg);
		return drFailed;
	}

	info("Downloading %s", item.GetTitle());

	CString outputFile;
	Downloader::EStatus status = m_downloader->Download(item, destDir,
		[this, &item](int percent)
		{
			DownloadProgress progress(&item, percent);
			Notify(&progress);
		},
		outputFile, errmsg);

	switch (status)
	{
		case Downloader::dsOk:
			info("Movie saved to %s", !outputFile.Empty() ? *outputFile : *destDir);
			if (!Util::EmptyStr(item.GetSymlinkDir()) && !outputFile.Empty() &&
				!Downloader::LinkFile(outputFile, item.GetSymlinkDir(), errmsg))
			{
				warn("Could not create symlink for %s in %s: %s", *outputFile, item.GetSymlinkDir(), *errmsg);
			}
			errmsg.Clear();
			if (!m_linkQueue->MarkDone(name, errmsg))
			{
				if (errmsg.Empty())
				{
					debug("Queue entry %s was removed by someone else", name);
				}
				else
				{
					error("Could not remove queue entry %s: %s", name, *errmsg);
				}
			}
			return drDone;

		case Downloader::dsPermanent:
			error("Download of %s failed: %s", item.GetTitle(), *errmsg);
			if (!m_linkQueue->MarkBroken(name, errmsg) && !errmsg.Empty())
			{
				error("Could not mark queue entry %s as broken: %s", name, *errmsg);
			}
			return drBroken;

		case Downloader::dsTransient:
		default:
			warn("Download of %s failed, keeping it for the next run: %s", item.GetTitle(), *errmsg);
			return drFailed;
	}
}
