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
#include "DiscoveryEngine.h"
#include "FileSystem.h"
#include "Log.h"
#include "Util.h"

const char* ChannelResult::ErrorKindName(EErrorKind errorKind)
{
	switch (errorKind)
	{
		case ekNone: return "ok";
		case ekConfig: return "config";
		case ekTransient: return "transient";
		case ekPermanent: return "permanent";
		case ekCancelled: return "cancelled";
	}
	return "unknown";
}

int DiscoveryEngine::CountNew(SourceItemList& listing, const char* lastItemId, int lastDownloadIndex,
	bool& markerFound)
{
	int total = (int)listing.size();
	markerFound = false;

	if (!Util::EmptyStr(lastItemId))
	{
		for (int i = 0; i < total; i++)
		{
			if (!strcmp(listing[i].GetId(), lastItemId))
			{
				markerFound = true;
				return i;
			}
		}
		return total;
	}

	if (lastDownloadIndex > 0)
	{
		return std::max(total - lastDownloadIndex, 0);
	}

	return total;
}

ChannelResult DiscoveryEngine::Discover(ChannelConfig& channel)
{
	int64 startTicks = Util::CurrentTicks();
	ChannelResult result(channel.GetName());

	FileLock lock(channel.GetFilename());
	if (!lock.Locked())
	{
		result.SetError(ChannelResult::ekPermanent, lock.GetErrMsg());
		result.SetDuration((Util::CurrentTicks() - startTicks) / 1000);
		return result;
	}

	// the document may have changed since the channel list was loaded
	ChannelConfig::ELoadStatus loadStatus = channel.Load();
	if (loadStatus != ChannelConfig::clLoaded)
	{
		result.SetError(ChannelResult::ekConfig, channel.GetErrMsg());
	}
	else if (Util::EmptyStr(channel.GetSourceUrl()))
	{
		result.SetError(ChannelResult::ekConfig, "source_url is missing");
	}
	else if (Util::EmptyStr(channel.GetTargetFolder()))
	{
		result.SetError(ChannelResult::ekConfig, "target_folder is missing");
	}

	if (!result.GetSuccess())
	{
		detail("Channel %s: %s", channel.GetName(), result.GetError());
		result.SetDuration((Util::CurrentTicks() - startTicks) / 1000);
		return result;
	}

	info("Processing channel %s", channel.GetName());

	SourceItemList listing;
	CString errmsg;
	SourceLister::EStatus status = FetchListing(channel, listing, errmsg);
	if (status != SourceLister::lsOk)
	{
		detail("Could not list channel %s: %s", channel.GetName(), *errmsg);
		result.SetError(status == SourceLister::lsTransient ? ChannelResult::ekTransient :
			ChannelResult::ekPermanent, errmsg);
		result.SetDuration((Util::CurrentTicks() - startTicks) / 1000);
		return result;
	}

	bool markerFound;
	int count = CountNew(listing, channel.GetLastItemId(), channel.GetLastDownloadIndex(), markerFound);
	if (!Util::EmptyStr(channel.GetLastItemId()) && !markerFound)
	{
		warn("Marker %s not found in listing of channel %s, all %i videos are new",
			channel.GetLastItemId(), channel.GetName(), count);
	}

	if (count == 0)
	{
		info("No new videos for %s", channel.GetName());
	}
	else
	{
		info("Found %i new video(s) for %s", count, channel.GetName());

		if (!EnqueueBatch(channel, listing, count, errmsg))
		{
			result.SetError(ChannelResult::ekPermanent, errmsg);
			result.SetDuration((Util::CurrentTicks() - startTicks) / 1000);
			return result;
		}

		channel.Advance(listing[0].GetId(), count);
		if (!channel.Save())
		{
			error("Could not save channel %s: %s", channel.GetName(), channel.GetErrMsg());
			result.SetError(ChannelResult::ekPermanent, channel.GetErrMsg());
			result.SetDuration((Util::CurrentTicks() - startTicks) / 1000);
			return result;
		}
	}

	result.SetNewItemCount(count);
	result.SetDuration((Util::CurrentTicks() - startTicks) / 1000);
	return result;
}

SourceLister::EStatus DiscoveryEngine::FetchListing(ChannelConfig& channel, SourceItemList& listing,
	CString& errmsg)
{
	const char* lastItemId = channel.GetLastItemId();

	if (!Util::EmptyStr(lastItemId) && m_probeItems > 0)
	{
		SourceLister::EStatus status = m_lister->List(channel.GetSourceUrl(), m_probeItems, listing, errmsg);
		if (status != SourceLister::lsOk)
		{
			return status;
		}

		bool markerFound;
		CountNew(listing, lastItemId, 0, markerFound);
		if (markerFound || (int)listing.size() < m_probeItems)
		{
			// a short probe is already the complete listing
			return SourceLister::lsOk;
		}

		debug("Marker of %s is older than the probe, requesting full listing", channel.GetName());
		listing.clear();
	}

	return m_lister->List(channel.GetSourceUrl(), 0, listing, errmsg);
}

void DiscoveryEngine::BuildItem(ChannelConfig& channel, SourceItem& source, int ordinal, ItemDescriptor& item)
{
	item.SetChannel(channel.GetName());
	item.SetId(source.GetId());
	item.SetTitle(source.GetTitle());
	item.SetUrl(source.GetUrl());
	item.SetOrdinal(ordinal);
	item.SetMaxHeight(channel.GetMaxHeight());
	item.SetTargetFolder(channel.GetTargetFolder());

	if (!channel.GetSubtitleLanguages()->empty())
	{
		item.SetSubtitleLanguages(channel.FormatSubtitleLanguages());
	}
	else
	{
		item.SetSubtitleLanguages(m_defaultSubtitleLanguages);
	}

	item.SetBrowserProfile(!Util::EmptyStr(channel.GetBrowserProfile()) ?
		channel.GetBrowserProfile() : *m_defaultBrowserProfile);
	item.SetSymlinkDir(!Util::EmptyStr(channel.GetSymlinkDir()) ?
		channel.GetSymlinkDir() : *m_defaultSymlinkDir);
}

bool DiscoveryEngine::EnqueueBatch(ChannelConfig& channel, SourceItemList& listing, int count, CString& errmsg)
{
	int lastDownloadIndex = channel.GetLastDownloadIndex();

	// listing is newest first, the queue receives the oldest first
	for (int i = count - 1; i >= 0; i--)
	{
		SourceItem& source = listing[i];
		ItemDescriptor item;
		BuildItem(channel, source, lastDownloadIndex + count - i, item);

		LinkQueue::EEnqueueResult enqueueResult = m_linkQueue->Enqueue(item, errmsg);
		switch (enqueueResult)
		{
			case LinkQueue::erCreated:
				detail("Queued %s (%s)", item.GetTitle(), *item.GetEntryName());
				break;

			case LinkQueue::erExists:
				debug("%s is already queued", item.GetTitle());
				break;

			case LinkQueue::erFailed:
				error("Could not queue %s of channel %s: %s", item.GetTitle(), channel.GetName(), *errmsg);
				return false;
		}
	}

	return true;
}
