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
#include "YtDlpLister.h"
#include "Options.h"
#include "Log.h"
#include "Util.h"

static const char* LISTING_TEMPLATE = "%(id)s\t%(title)s\t%(url)s";

void ListingProcess::BuildArgs(const char* sourceUrl, int maxItems)
{
	// the command may carry its own arguments, e.g. "python3 -m yt_dlp"
	const char* ytDlpCmd = g_Options ? g_Options->GetYtDlpCmd() : "yt-dlp";
	ArgList args = Util::SplitCommandLine(ytDlpCmd);
	if (args.empty())
	{
		args.emplace_back(ytDlpCmd);
	}
	args.emplace_back("--flat-playlist");
	args.emplace_back("--no-warnings");
	args.emplace_back("--print");
	args.emplace_back(LISTING_TEMPLATE);
	if (maxItems > 0)
	{
		args.emplace_back("--playlist-items");
		args.emplace_back(CString::FormatStr("1:%i", maxItems));
	}
	if (g_Options && !Util::EmptyStr(g_Options->GetExtractorArgs()))
	{
		args.emplace_back("--extractor-args");
		args.emplace_back(g_Options->GetExtractorArgs());
	}
	args.emplace_back(sourceUrl);

	SetArgs(std::move(args));
}

void ListingProcess::ProcessOutput(char* text)
{
	for (char* pend = text + strlen(text) - 1; pend >= text && (*pend == '\n' || *pend == '\r'); pend--) *pend = '\0';

	if (text[0] == '\0')
	{
		return;
	}

	if (!strncmp(text, "ERROR: ", 7))
	{
		m_errmsg = text + 7;
		PrintMessage(Message::mkDetail, "%s", text);
		return;
	}

	char* tab1 = strchr(text, '\t');
	char* tab2 = tab1 ? strchr(tab1 + 1, '\t') : nullptr;
	if (!tab2)
	{
		ProcessController::ProcessOutput(text);
		return;
	}

	*tab1 = '\0';
	*tab2 = '\0';
	const char* id = text;
	const char* title = tab1 + 1;
	const char* url = tab2 + 1;

	if (Util::EmptyStr(id) || !strcmp(id, "NA"))
	{
		debug("Skipping listing line without id");
		return;
	}

	m_items.emplace_back(id, title, !Util::EmptyStr(url) && strcmp(url, "NA") ? url : id);
}

SourceLister::EStatus YtDlpLister::ClassifyError(const char* errmsg)
{
	static const char* PERMANENT_ERRORS[] = {
		"Unsupported URL",
		"does not exist",
		"is not a valid URL",
		"not available",
		"This channel",
		"has been terminated",
		"has been removed",
		"Private video",
		"HTTP Error 404",
		"HTTP Error 410",
		nullptr
	};

	if (Util::EmptyStr(errmsg))
	{
		return SourceLister::lsTransient;
	}

	for (int i = 0; PERMANENT_ERRORS[i]; i++)
	{
		if (strstr(errmsg, PERMANENT_ERRORS[i]))
		{
			return SourceLister::lsPermanent;
		}
	}

	// network problems, throttling and server errors may go away on their own
	return SourceLister::lsTransient;
}

SourceLister::EStatus YtDlpLister::List(const char* sourceUrl, int maxItems,
	SourceItemList& items, CString& errmsg)
{
	ListingProcess process(items);
	process.BuildArgs(sourceUrl, maxItems);
	process.SetInfoName(sourceUrl);
	process.SetLogPrefix(sourceUrl);
	if (g_Options)
	{
		process.SetWorkingDir(g_Options->GetTempDir());
	}

	int exitCode = process.Execute();

	if (process.GetStartError())
	{
		errmsg.Format("could not start %s", process.GetProgram());
		items.clear();
		return lsPermanent;
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
		items.clear();
		return ClassifyError(process.GetErrMsg());
	}

	return lsOk;
}
