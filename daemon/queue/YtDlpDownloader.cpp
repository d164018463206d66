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
#include "YtDlpDownloader.h"
#include "Options.h"
#include "Log.h"
#include "Util.h"

static const char* OUTPUT_TEMPLATE = "%(upload_date)s %(title)s.%(ext)s";
static const char* SAVED_PREFIX = "SAVED:";

CString DownloadProcess::FormatSelector(int maxHeight)
{
	return CString::FormatStr("bestvideo[height<=%i][vcodec!~='vp0?9']+bestaudio/best", maxHeight);
}

void DownloadProcess::BuildArgs(ItemDescriptor& item, const char* destDir)
{
	const char* ytDlpCmd = g_Options ? g_Options->GetYtDlpCmd() : "yt-dlp";
	ArgList args = Util::SplitCommandLine(ytDlpCmd);
	if (args.empty())
	{
		args.emplace_back(ytDlpCmd);
	}
	args.emplace_back("--newline");
	args.emplace_back("--no-simulate");
	args.emplace_back("--progress");
	args.emplace_back("--print");
	args.emplace_back(CString::FormatStr("after_move:%s%%(filepath)s", SAVED_PREFIX));
	args.emplace_back("-f");
	args.emplace_back(FormatSelector(item.GetMaxHeight()));
	args.emplace_back("--write-description");
	args.emplace_back("--write-thumbnail");

	if (!Util::EmptyStr(item.GetSubtitleLanguages()))
	{
		args.emplace_back("--write-subs");
		args.emplace_back("--sub-langs");
		args.emplace_back(item.GetSubtitleLanguages());
	}

	if (!Util::EmptyStr(item.GetBrowserProfile()))
	{
		args.emplace_back("--cookies-from-browser");
		args.emplace_back(item.GetBrowserProfile());
	}

	if (g_Options && !Util::EmptyStr(g_Options->GetExtractorArgs()))
	{
		args.emplace_back("--extractor-args");
		args.emplace_back(g_Options->GetExtractorArgs());
	}

	args.emplace_back("-o");
	args.emplace_back(CString::FormatStr("%s%c%s", destDir, PATH_SEPARATOR, OUTPUT_TEMPLATE));
	args.emplace_back(item.GetUrl());

	SetArgs(std::move(args));
}

int DownloadProcess::ParseProgress(const char* text)
{
	if (!m_progressRegEx.Match(text) || m_progressRegEx.GetMatchCount() < 2)
	{
		return -1;
	}

	int percent = atoi(text + m_progressRegEx.GetMatchStart(1));
	return std::min(std::max(percent, 0), 100);
}

void DownloadProcess::ProcessOutput(char* text)
{
	for (char* pend = text + strlen(text) - 1; pend >= text && (*pend == '\n' || *pend == '\r'); pend--) *pend = '\0';

	if (text[0] == '\0')
	{
		return;
	}

	if (!strncmp(text, SAVED_PREFIX, strlen(SAVED_PREFIX)))
	{
		m_outputFile = text + strlen(SAVED_PREFIX);
		return;
	}

	if (!strncmp(text, "ERROR: ", 7))
	{
		m_errmsg = text + 7;
		PrintMessage(Message::mkDetail, "%s", text);
		return;
	}

	int percent = ParseProgress(text);
	if (percent >= 0)
	{
		if (percent != m_lastPercent && m_progress)
		{
			m_lastPercent = percent;
			m_progress(percent);
		}
		return;
	}

	ProcessController::ProcessOutput(text);
}

Downloader::EStatus YtDlpDownloader::ClassifyError(const char* errmsg)
{
	static const char* PERMANENT_ERRORS[] = {
		"Unsupported URL",
		"Private video",
		"Video unavailable",
		"not available",
		"has been removed",
		"does not exist",
		"members-only",
		"HTTP Error 404",
		"HTTP Error 410",
		nullptr
	};

	if (Util::EmptyStr(errmsg))
	{
		return dsTransient;
	}

	for (int i = 0; PERMANENT_ERRORS[i]; i++)
	{
		if (strstr(errmsg, PERMANENT_ERRORS[i]))
		{
			return dsPermanent;
		}
	}

	return dsTransient;
}

const char* YtDlpDownloader::ErrorHint(const char* errmsg)
{
	if (Util::EmptyStr(errmsg))
	{
		return "download failed, see log for details";
	}

	if (strstr(errmsg, "403") || strstr(errmsg, "Forbidden"))
	{
		return "access denied by the site, update yt-dlp or adjust ExtractorArgs (player client, JS runtime)";
	}

	if (strstr(errmsg, "Sign in") || strstr(errmsg, "bot"))
	{
		return "the site asks to sign in, set browser_profile of the channel or option CookiesFromBrowser";
	}

	return "download failed, see log for details";
}

Downloader::EStatus YtDlpDownloader::Download(ItemDescriptor& item, const char* destDir,
	ProgressFunc progress, CString& outputFile, CString& errmsg)
{
	DownloadProcess process(progress);
	process.BuildArgs(item, destDir);
	process.SetInfoName(item.GetTitle());
	process.SetLogPrefix(item.GetTitle());
	process.SetWorkingDir(destDir);

	int exitCode = process.Execute();

	if (process.GetStartError())
	{
		// not a problem of the entry, keep it for the next run
		errmsg.Format("could not start %s", process.GetProgram());
		return dsTransient;
	}

	if (exitCode != 0)
	{
		if (!Util::EmptyStr(process.GetErrMsg()))
		{
			errmsg = process.GetErrMsg();
		}
		else
		{
			errmsg.Format("%s exited with code %i", process.GetProgram(), exitCode);
		}
		warn("%s: %s", item.GetTitle(), ErrorHint(process.GetErrMsg()));
		return ClassifyError(process.GetErrMsg());
	}

	outputFile = process.GetOutputFile();
	return dsOk;
}
