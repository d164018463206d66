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


#ifndef DISCOVERYENGINE_H
#define DISCOVERYENGINE_H

#include "NString.h"
#include "ChannelConfig.h"
#include "SourceLister.h"
#include "LinkQueue.h"

/*
Outcome of the discovery of one channel, including all retries.
 */
class ChannelResult
{
public:
	enum EErrorKind
	{
		ekNone,
		ekConfig,
		ekTransient,
		ekPermanent,
		ekCancelled
	};

	ChannelResult(const char* channelName) : m_channelName(channelName) {}
	ChannelResult(ChannelResult&& other) = default;
	ChannelResult& operator=(ChannelResult&& other) = default;
	const char* GetChannelName() { return m_channelName; }
	int GetNewItemCount() { return m_newItemCount; }
	void SetNewItemCount(int newItemCount) { m_newItemCount = newItemCount; }
	bool GetSuccess() { return m_errorKind == ekNone; }
	EErrorKind GetErrorKind() { return m_errorKind; }
	const char* GetError() { return m_error; }
	void SetError(EErrorKind errorKind, const char* error) { m_errorKind = errorKind; m_error = error; }
	int GetRetryCount() { return m_retryCount; }
	void SetRetryCount(int retryCount) { m_retryCount = retryCount; }
	int64 GetDuration() { return m_duration; }
	void SetDuration(int64 duration) { m_duration = duration; }
	static const char* ErrorKindName(EErrorKind errorKind);

private:
	CString m_channelName;
	int m_newItemCount = 0;
	EErrorKind m_errorKind = ekNone;
	CString m_error;
	int m_retryCount = 0;
	int64 m_duration = 0; // msec
};

typedef std::vector<ChannelResult> ChannelResultList;

/*
Finds the videos of a channel published after its marker, writes them into
the link queue oldest first and then moves the marker forward.
 */
class DiscoveryEngine
{
public:
	DiscoveryEngine(SourceLister* lister, LinkQueue* linkQueue) :
		m_lister(lister), m_linkQueue(linkQueue) {}
	void SetProbeItems(int probeItems) { m_probeItems = probeItems; }
	void SetDefaultSubtitleLanguages(const char* subtitleLanguages) { m_defaultSubtitleLanguages = subtitleLanguages; }
	void SetDefaultBrowserProfile(const char* browserProfile) { m_defaultBrowserProfile = browserProfile; }
	void SetDefaultSymlinkDir(const char* symlinkDir) { m_defaultSymlinkDir = symlinkDir; }

	/*
	Runs one discovery attempt. The channel document is reloaded and
	rewritten under its lock, "channel" receives the new state.
	 */
	ChannelResult Discover(ChannelConfig& channel);

	/*
	Number of leading (newest) entries of "listing" which are newer than
	the marker. "markerFound" is set if "lastItemId" is present in the listing.
	 */
	static int CountNew(SourceItemList& listing, const char* lastItemId, int lastDownloadIndex,
		bool& markerFound);

private:
	SourceLister* m_lister;
	LinkQueue* m_linkQueue;
	int m_probeItems = 5;
	CString m_defaultSubtitleLanguages;
	CString m_defaultBrowserProfile;
	CString m_defaultSymlinkDir;

	SourceLister::EStatus FetchListing(ChannelConfig& channel, SourceItemList& listing, CString& errmsg);
	void BuildItem(ChannelConfig& channel, SourceItem& source, int ordinal, ItemDescriptor& item);
	bool EnqueueBatch(ChannelConfig& channel, SourceItemList& listing, int count, CString& errmsg);
};

#endif
