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


#ifndef CHANNELCONFIG_H
#define CHANNELCONFIG_H

#include "NString.h"
#include "FileSystem.h"

/*
Channel document "<ChannelDir>/<name>.conf": where to look for new videos,
where to put them, and the marker of the newest video already queued.
 */
class ChannelConfig
{
public:
	enum ELoadStatus
	{
		clLoaded,
		clNotChannel,
		clError
	};

	typedef std::vector<CString> NameList;

	static const int DEFAULT_MAX_HEIGHT = 1080;

	ChannelConfig(const char* filename);
	ChannelConfig(const char* name, const char* sourceUrl, const char* targetFolder);
	ELoadStatus Load();
	bool Save();
	const char* GetErrMsg() { return m_errmsg; }
	const char* GetName() { return m_name; }
	const char* GetFilename() { return m_filename; }
	void SetFilename(const char* filename) { m_filename = filename; }
	const char* GetSourceUrl() { return m_sourceUrl; }
	void SetSourceUrl(const char* sourceUrl) { m_sourceUrl = sourceUrl; }
	const char* GetTargetFolder() { return m_targetFolder; }
	void SetTargetFolder(const char* targetFolder) { m_targetFolder = targetFolder; }
	int GetMaxHeight() { return m_maxHeight; }
	void SetMaxHeight(int maxHeight) { m_maxHeight = maxHeight; }
	NameList* GetSubtitleLanguages() { return &m_subtitleLanguages; }
	const char* GetBrowserProfile() { return m_browserProfile; }
	void SetBrowserProfile(const char* browserProfile) { m_browserProfile = browserProfile; }
	const char* GetSymlinkDir() { return m_symlinkDir; }
	void SetSymlinkDir(const char* symlinkDir) { m_symlinkDir = symlinkDir; }
	const char* GetLastItemId() { return m_lastItemId; }
	int GetLastDownloadIndex() { return m_lastDownloadIndex; }
	void SetMarker(const char* lastItemId, int lastDownloadIndex);

	/*
	Moves the marker forward after a batch of "count" items was queued,
	"lastItemId" being the newest of them.
	 */
	void Advance(const char* lastItemId, int count);

	/* Comma separated list, as written into the document */
	CString FormatSubtitleLanguages();

private:
	typedef std::vector<CString> LineList;

	CString m_filename;
	CString m_name;
	CString m_errmsg;
	CString m_sourceUrl;
	CString m_targetFolder;
	int m_maxHeight = DEFAULT_MAX_HEIGHT;
	NameList m_subtitleLanguages;
	CString m_browserProfile;
	CString m_symlinkDir;
	CString m_lastItemId;
	int m_lastDownloadIndex = 0;
	LineList m_otherLines;

	void Reset();
	bool ParseLine(char* line, int lineNo);
	static CString Unquote(const char* value);
	static void ParseList(const char* value, NameList& list);
};

typedef std::vector<std::unique_ptr<ChannelConfig>> ChannelList;

class ChannelLoader
{
public:
	/*
	Loads all channel documents of the directory, sorted by channel name.
	Documents which are not channels are skipped with a warning.
	Returns false if the directory can not be read.
	 */
	static bool LoadAll(const char* channelDir, ChannelList& channels);
};

#endif
