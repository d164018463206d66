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


#ifndef YTDLPLISTER_H
#define YTDLPLISTER_H

#include "SourceLister.h"
#include "Process.h"

/*
Lists videos with "yt-dlp --flat-playlist", one child process per request.
 */
class YtDlpLister : public SourceLister
{
public:
	virtual EStatus List(const char* sourceUrl, int maxItems, SourceItemList& items, CString& errmsg);

	/* Sorts a failure message of yt-dlp into temporary and permanent problems */
	static EStatus ClassifyError(const char* errmsg);
};

class ListingProcess : public ProcessController
{
public:
	ListingProcess(SourceItemList& items) : m_items(items) {}
	const char* GetErrMsg() { return m_errmsg; }
	void BuildArgs(const char* sourceUrl, int maxItems);

protected:
	virtual void ProcessOutput(char* text);

private:
	SourceItemList& m_items;
	CString m_errmsg;
};

#endif
