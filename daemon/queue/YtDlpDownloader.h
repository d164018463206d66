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


#ifndef YTDLPDOWNLOADER_H
#define YTDLPDOWNLOADER_H

#include "Downloader.h"
#include "Process.h"
#include "Util.h"

/*
Downloads a video with yt-dlp, the best format up to the height limit
of the entry merged with the best audio.
 */
class YtDlpDownloader : public Downloader
{
public:
	virtual EStatus Download(ItemDescriptor& item, const char* destDir, ProgressFunc progress,
		CString& outputFile, CString& errmsg);

	/* Sorts a failure message of yt-dlp into temporary and permanent problems */
	static EStatus ClassifyError(const char* errmsg);

	/* Explanation for the operator of a failed download */
	static const char* ErrorHint(const char* errmsg);
};

class DownloadProcess : public ProcessController
{
public:
	DownloadProcess(Downloader::ProgressFunc progress) :
		m_progress(progress), m_progressRegEx("^\\[download\\] +([0-9]+)(\\.[0-9]+)?%") {}
	void BuildArgs(ItemDescriptor& item, const char* destDir);
	const char* GetErrMsg() { return m_errmsg; }
	const char* GetOutputFile() { return m_outputFile; }
	static CString FormatSelector(int maxHeight);

	/* Percentage of a "[download]  12.5% of ..." line or -1 */
	int ParseProgress(const char* text);

protected:
	virtual void ProcessOutput(char* text);

private:
	Downloader::ProgressFunc m_progress;
	CString m_errmsg;
	CString m_outputFile;
	int m_lastPercent = -1;
	RegEx m_progressRegEx;
};

#endif
