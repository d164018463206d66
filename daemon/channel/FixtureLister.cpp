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
#include "FixtureLister.h"
#include "StateFile.h"
#include "FileSystem.h"
#include "Options.h"
#include "Log.h"
#include "Util.h"

CString FixtureLister::ResolvePath(const char* sourceUrl)
{
	const char* path = sourceUrl;
	if (!strncmp(path, "file://", 7))
	{
		path += 7;
	}

	CString filename = FileSystem::ExpandHomePath(path);
	if (!FileSystem::IsAbsolutePath(filename) && g_Options && !Util::EmptyStr(g_Options->GetChannelDir()))
	{
		filename = CString::FormatStr("%s%c%s", g_Options->GetChannelDir(), PATH_SEPARATOR, *filename);
	}
	return filename;
}

SourceLister::EStatus FixtureLister::List(const char* sourceUrl, int maxItems,
	SourceItemList& items, CString& errmsg)
{
	CString filename = ResolvePath(sourceUrl);

	StateFile stateFile(filename, "", 1);
	StateDiskFile* infile = stateFile.BeginRead();
	if (!infile)
	{
		errmsg = stateFile.GetErrMsg();
		return lsPermanent;
	}

	EStatus status = lsOk;
	char buf[4096];
	while (infile->ReadLine(buf, sizeof(buf)))
	{
		if (!strncmp(buf, "#error ", 7))
		{
			char* kind = buf + 7;
			char* text = strchr(kind, ' ');
			if (text)
			{
				*text++ = '\0';
			}
			status = !strcmp(kind, "transient") ? lsTransient : lsPermanent;
			errmsg = text ? text : "listing failed";
			break;
		}

		if (buf[0] == '#' || buf[0] == '\0')
		{
			continue;
		}

		if (maxItems > 0 && (int)items.size() >= maxItems)
		{
			break;
		}

		Tokenizer tok(buf, "\t", true);
		const char* id = tok.Next();
		const char* title = tok.Next();
		const char* url = tok.Next();
		if (!id)
		{
			continue;
		}

		items.emplace_back(id, title ? title : id, url ? url : id);
	}
	infile->Close();

	if (status != lsOk)
	{
		items.clear();
	}

	debug("Fixture %s: %i item(s)", *filename, (int)items.size());

	return status;
}
