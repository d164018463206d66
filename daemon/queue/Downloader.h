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


#ifndef DOWNLOADER_H
#define DOWNLOADER_H

#include "NString.h"
#include "Options.h"
#include "LinkQueue.h"

/*
Fetches the media of one queue entry into a destination folder.
Implementations must allow concurrent calls from several threads.
 */
class Downloader
{
public:
	enum EStatus
	{
		dsOk,
		dsTransient,
		dsPermanent
	};

	typedef std::function<void(int percent)> ProgressFunc;

	virtual ~Downloader() {}

	/* On success "outputFile" receives the path of the saved file */
	virtual EStatus Download(ItemDescriptor& item, const char* destDir, ProgressFunc progress,
		CString& outputFile, CString& errmsg) = 0;

	static std::unique_ptr<Downloader> Create(Options::EDownloader kind);

	/* Creates "<symlinkDir>/<name of file>" pointing to "filename" */
	static bool LinkFile(const char* filename, const char* symlinkDir, CString& errmsg);
};

#endif
