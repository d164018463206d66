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


#ifndef FRONTEND_H
#define FRONTEND_H

#include "Thread.h"
#include "Log.h"
#include "Observer.h"
#include "DiscoveryCoordinator.h"
#include "DownloadCoordinator.h"

class Frontend : public Thread
{
public:
	enum EVerbosity
	{
		fvNormal,
		fvQuiet,
		fvVerbose
	};

	class Report
	{
	public:
		enum EKind
		{
			rkSuccess,
			rkFailure,
			rkText
		};

		Report(EKind kind, const char* text) : m_kind(kind), m_text(text) {}
		EKind GetKind() { return m_kind; }
		const char* GetText() { return m_text; }

	private:
		EKind m_kind;
		CString m_text;
	};

	typedef std::deque<Report> ReportList;

	Frontend();
	virtual ~Frontend();
	virtual void Stop();
	void SetVerbosity(EVerbosity verbosity) { m_verbosity = verbosity; }
	void AttachDiscovery(DiscoveryCoordinator* coordinator);
	void AttachDownload(DownloadCoordinator* coordinator);
	void DetachDiscovery();
	void DetachDownload();
	void AddDiscoverySummary(DiscoverySummary& summary, ChannelResultList& results);
	void AddDownloadSummary(DownloadSummary& summary);

	/* Lines printed for a settled channel and the summary of a discovery run */
	static CString FormatProgress(DiscoveryProgress& progress);
	static void FormatSummary(DiscoverySummary& summary, ChannelResultList& results, ReportList& lines);

protected:
	uint32 m_neededLogFirstId = 0;
	int m_updateInterval;
	EVerbosity m_verbosity = fvNormal;
	Mutex m_waitMutex;
	ConditionVar m_waitCond;

	GuardedMessageList GuardMessages() { return g_Log->GuardMessages(); }
	void TakeReports(ReportList& reports);
	CString GetStatus();
	void Wait(int milliseconds);

private:
	class DiscoveryObserver : public Observer
	{
	public:
		Frontend* m_owner;
		virtual void Update(Subject* caller, void* aspect) { m_owner->DiscoveryUpdate((DiscoveryProgress*)aspect); }
	};

	class DownloadObserver : public Observer
	{
	public:
		Frontend* m_owner;
		virtual void Update(Subject* caller, void* aspect) { m_owner->DownloadUpdate((DownloadProgress*)aspect); }
	};

	DiscoveryObserver m_discoveryObserver;
	DownloadObserver m_downloadObserver;
	DiscoveryCoordinator* m_discoveryCoordinator = nullptr;
	DownloadCoordinator* m_downloadCoordinator = nullptr;
	Mutex m_reportMutex;
	ReportList m_reports;
	CString m_status;

	void AddReport(Report::EKind kind, const char* text);
	void DiscoveryUpdate(DiscoveryProgress* progress);
	void DownloadUpdate(DownloadProgress* progress);
};

#endif
