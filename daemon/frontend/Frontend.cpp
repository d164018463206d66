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
#include "Options.h"
#include "Frontend.h"
#include "Log.h"
#include "Util.h"

Frontend::Frontend()
{
	debug("Creating Frontend");

	m_discoveryObserver.m_owner = this;
	m_downloadObserver.m_owner = this;

	m_updateInterval = g_Options->GetUpdateInterval();
}

Frontend::~Frontend()
{
	DetachDiscovery();
	DetachDownload();
}

void Frontend::Stop()
{
	Thread::Stop();

	Guard guard(m_waitMutex);
	m_waitCond.NotifyAll();
}

void Frontend::AttachDiscovery(DiscoveryCoordinator* coordinator)
{
	m_discoveryCoordinator = coordinator;
	coordinator->Attach(&m_discoveryObserver);
}

void Frontend::AttachDownload(DownloadCoordinator* coordinator)
{
	m_downloadCoordinator = coordinator;
	coordinator->Attach(&m_downloadObserver);
}

void Frontend::DetachDiscovery()
{
	if (m_discoveryCoordinator)
	{
		m_discoveryCoordinator->Detach(&m_discoveryObserver);
		m_discoveryCoordinator = nullptr;
	}
}

void Frontend::DetachDownload()
{
	if (m_downloadCoordinator)
	{
		m_downloadCoordinator->Detach(&m_downloadObserver);
		m_downloadCoordinator = nullptr;
	}
}

void Frontend::AddReport(Report::EKind kind, const char* text)
{
	{
		Guard guard(m_reportMutex);
		m_reports.emplace_back(kind, text);
	}

	Guard guard(m_waitMutex);
	m_waitCond.NotifyAll();
}

void Frontend::TakeReports(ReportList& reports)
{
	Guard guard(m_reportMutex);
	reports = std::move(m_reports);
	m_reports.clear();
}

CString Frontend::GetStatus()
{
	Guard guard(m_reportMutex);
	return CString(*m_status);
}

void Frontend::Wait(int milliseconds)
{
	Guard guard(m_waitMutex);
	m_waitCond.WaitFor(m_waitMutex, milliseconds);
}

CString Frontend::FormatProgress(DiscoveryProgress& progress)
{
	ChannelResult* result = progress.GetResult();
	if (result->GetSuccess())
	{
		return CString::FormatStr("[%i/%i] ✓ %s: %i new video%s", progress.GetCompleted(),
			progress.GetTotal(), result->GetChannelName(), result->GetNewItemCount(),
			result->GetNewItemCount() == 1 ? "" : "s");
	}

	return CString::FormatStr("[%i/%i] ✗ %s: %s", progress.GetCompleted(), progress.GetTotal(),
		result->GetChannelName(), result->GetError());
}

void Frontend::FormatSummary(DiscoverySummary& summary, ChannelResultList& results, ReportList& lines)
{
	lines.emplace_back(Report::rkText, CString::FormatStr("Channels processed: %i/%i",
		summary.GetSucceeded(), summary.GetTotal()));
	lines.emplace_back(Report::rkText, CString::FormatStr("New videos queued: %i", summary.GetNewItems()));
	lines.emplace_back(Report::rkText, CString::FormatStr("Total retries: %i", summary.GetRetries()));
	lines.emplace_back(Report::rkText, CString::FormatStr("Elapsed time: %s",
		*Util::FormatDuration(summary.GetElapsed())));

	if (summary.GetSucceeded() == summary.GetTotal())
	{
		return;
	}

	lines.emplace_back(Report::rkFailure, "Failed channels:");
	for (ChannelResult& result : results)
	{
		if (!result.GetSuccess())
		{
			lines.emplace_back(Report::rkFailure, CString::FormatStr("  %s: [%s] %s (retries: %i)",
				result.GetChannelName(), ChannelResult::ErrorKindName(result.GetErrorKind()),
				result.GetError(), result.GetRetryCount()));
		}
	}
}

void Frontend::AddDiscoverySummary(DiscoverySummary& summary, ChannelResultList& results)
{
	ReportList lines;
	FormatSummary(summary, results, lines);
	for (Report& line : lines)
	{
		AddReport(line.GetKind(), line.GetText());
	}
}

void Frontend::AddDownloadSummary(DownloadSummary& summary)
{
	AddReport(Report::rkText, CString::FormatStr("Downloaded: %i, broken: %i, failed: %i, left pending: %i",
		summary.GetDone(), summary.GetBroken(), summary.GetFailed(), summary.GetPending()));
	AddReport(Report::rkText, CString::FormatStr("Elapsed time: %s", *Util::FormatDuration(summary.GetElapsed())));
}

void Frontend::DiscoveryUpdate(DiscoveryProgress* progress)
{
	{
		Guard guard(m_reportMutex);
		m_status.Format("Discovery: %i/%i channels", progress->GetCompleted(), progress->GetTotal());
	}

	if (m_verbosity != fvQuiet)
	{
		AddReport(progress->GetResult()->GetSuccess() ? Report::rkSuccess : Report::rkFailure,
			FormatProgress(*progress));
	}
}

void Frontend::DownloadUpdate(DownloadProgress* progress)
{
	{
		Guard guard(m_reportMutex);
		m_status.Format("Downloading %s: %i%%", progress->GetItem()->GetTitle(), progress->GetPercent());
	}

	if (m_verbosity == fvVerbose && progress->GetPercent() % 25 == 0)
	{
		AddReport(Report::rkText, CString::FormatStr("[download] %s: %i%%",
			progress->GetItem()->GetTitle(), progress->GetPercent()));
	}
}
