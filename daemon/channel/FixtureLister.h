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


#ifndef FIXTURELISTER_H
#define FIXTURELISTER_H

#include "SourceLister.h"

/*
Reads the listing from a local file instead of asking a site.
The source url is the path of the file, relative paths are resolved
against the channel directory. Each line is "id<TAB>title<TAB>url",
newest first. A line "#error transient <text>" or "#error permanent <text>"
makes the listing fail with that classification.
 */
class FixtureLister : public SourceLister
{
public:
	virtual EStatus List(const char* sourceUrl, int maxItems, SourceItemList& items, CString& errmsg);

private:
	CString ResolvePath(const char* sourceUrl);
};

#endif
