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


#ifndef LINKQUEUE_H
#define LINKQUEUE_H

#include "NString.h"
#include "Thread.h"

/*
One discovered video together with everything needed to download it
later without asking the source again.
 */
class ItemDescriptor
{
public:
	ItemDescriptor() {}
	ItemDescriptor(const char* channel, const char* id, const char* title, const char* url) :
		m_channel(channel), m_id(id), m_title(title), m_url(url) {}
	ItemDescriptor(ItemDescriptor&& other) = default;
	ItemDescriptor& operator=(ItemDescriptor&& other) = default;
	const char* GetChannel() { return m_channel; }
	void SetChannel(const char* channel) { m_channel = channel; }
	const char* GetId() { return m_id; }
	void SetId(const char* id) { m_id = id; }
	const char* GetTitle() { return m_title; }
	void SetTitle(const char* title) { m_title = title; }
	const char* GetUrl() { return m_url; }
	void SetUrl(const char* url) { m_url = url; }
	int GetOrdinal() { return m_ordinal; }
	void SetOrdinal(int ordinal) { m_ordinal = ordinal; }
	int GetMaxHeight() { return m_maxHeight; }
	void SetMaxHeight(int maxHeight) { m_maxHeight = maxHeight; }
	const char* GetTargetFolder() { return m_targetFolder; }
	void SetTargetFolder(const char* targetFolder) { m_targetFolder = targetFolder; }
	const char* GetSubtitleLanguages() { return m_subtitleLanguages; }
	void SetSubtitleLanguages(const char* subtitleLanguages) { m_subtitleLanguages = subtitleLanguages; }
	const char* GetBrowserProfile() { return m_browserProfile; }
	void SetBrowserProfile(const char* browserProfile) { m_browserProfile = browserProfile; }
	const char* GetSymlinkDir() { return m_symlinkDir; }
	void SetSymlinkDir(const char* symlinkDir) { m_symlinkDir = symlinkDir; }

	/* Queue entry name derived from channel and id */
	CString GetEntryName();

private:
	CString m_channel;
	CString m_id;
	CString m_title;
	CString m_url;
	int m_ordinal = 0;
	int m_maxHeight = 1080;
	CString m_targetFolder;
	CString m_subtitleLanguages;
	CString m_browserProfile;
	CString m_symlinkDir;
};

/*
Directory of queue entries, one file per item: "<name>.link" for pending
and "<name>.broken" for failed entries. Every transition is a single
rename or unlink, entries are never visible half-written.
 */
class LinkQueue
{
public:
	enum EEnqueueResult
	{
		erCreated,
		erExists,
		erFailed
	};

	typedef std::vector<CString> NameList;

	static const int ENTRY_NAME_LEN = 20;

	LinkQueue(const char* queueDir) : m_queueDir(queueDir) {}
	virtual ~LinkQueue() {}
	const char* GetQueueDir() { return m_queueDir; }
	static CString EntryName(const char* channel, const char* id);

	EEnqueueResult Enqueue(ItemDescriptor& item, CString& errmsg);

	/* Names of pending entries as found on disk right now */
	NameList ListPending();
	NameList ListBroken();
	virtual bool Exists(const char* name);
	virtual bool IsBroken(const char* name);
	bool Load(const char* name, ItemDescriptor& item, CString& errmsg);

	/* false if the entry has vanished (handled elsewhere) or could not be removed */
	bool MarkDone(const char* name, CString& errmsg);
	bool MarkBroken(const char* name, CString& errmsg);

	/* Accepts an entry name or a path to a ".link" file of this queue */
	CString ResolveEntry(const char* nameOrPath);

private:
	CString m_queueDir;

	CString PendingFilename(const char* name);
	CString BrokenFilename(const char* name);
	NameList List(const char* extension);
};

#endif
