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
#include "FixtureDownloader.h"
#include "FileSystem.h"
#include "Log.h"

Downloader::EStatus FixtureDownloader::Download(ItemDescriptor& item, const char* destDir,
	ProgressFunc progress, CString& outputFile, CString& errmsg)
{
	if (strstr(item.GetUrl(), "fail-transient"))
	{
		errmsg.Format("simulated temporary failure of %s", item.GetUrl());
		return dsTransient;
	}

	if (strstr(item.GetUrl(), "fail-permanent"))
	{
		errmsg.Format("simulated permanent failure of %s", item.GetUrl());
		return dsPermanent;
	}

	if (progress)
	{
		progress(0);
	}

	CString name = FileSystem::MakeValidFilename(BString<1024>("%04i %s.txt", item.GetOrdinal(), item.GetTitle()));
	BString<1024> filename("%s%c%s", destDir, PATH_SEPARATOR, *name);

	BString<1024> content("%s\n", item.GetUrl());
	if (!FileSystem::SaveBufferIntoFile(filename, content, content.Length()))
	{
		errmsg.Format("could not write %s: %s", *filename, *FileSystem::GetLastErrorMessage());
		return dsTransient;
	}

	if (progress)
	{
		progress(100);
	}

	outputFile = filename;
	return dsOk;
}
