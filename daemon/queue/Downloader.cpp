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
#include "Downloader.h"
#include "YtDlpDownloader.h"
#include "FixtureDownloader.h"
#include "FileSystem.h"
#include "Log.h"

std::unique_ptr<Downloader> Downloader::Create(Options::EDownloader kind)
{
	switch (kind)
	{
		case Options::dlFixture:
			return std::make_unique<FixtureDownloader>();

		case Options::dlYtDlp:
		default:
			return std::make_unique<YtDlpDownloader>();
	}
}

bool Downloader::LinkFile(const char* filename, const char* symlinkDir, CString& errmsg)
{
	if (!FileSystem::ForceDirectories(symlinkDir, errmsg))
	{
		return false;
	}

	BString<1024> linkFilename("%s%c%s", symlinkDir, PATH_SEPARATOR, FileSystem::BaseFileName(filename));
	return FileSystem::CreateSymlink(filename, linkFilename, errmsg);
}
