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


#ifndef SOURCELISTER_H
#define SOURCELISTER_H

#include "NString.h"
#include "Options.h"

class SourceItem
{
public:
	SourceItem(const char* id, const char* title, const char* url) :
		m_id(id), m_title(title), m_url(url) {}
	SourceItem(SourceItem&& other) = default;
	SourceItem& operator=(SourceItem&& other) = default;
	const char* GetId() { return m_id; }
	const char* GetTitle() { return m_title; }
	const char* GetUrl() { return m_url; }

private:
	CString m_id;
	CString m_title;
	CString m_url;
};

typedef std::vector<SourceItem> SourceItemList;

/*
Lists the videos of a source, newest first.
Implementations must allow concurrent calls from several threads.
 */
class SourceLister
{
public:
	enum EStatus
	{
		lsOk,
		lsTransient,
		lsPermanent
	};

	virtual ~SourceLister() {}

	/*
	Fills "items" with at most "maxItems" newest videos of the source,
	or with the complete listing if "maxItems" is 0.
	 */
	virtual EStatus List(const char* sourceUrl, int maxItems, SourceItemList& items, CString& errmsg) = 0;

	static std::unique_ptr<SourceLister> Create(Options::ELister kind);
};

#endif
