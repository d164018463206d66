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
#include "LinkQueue.h"
#include "StateFile.h"
#include "FileSystem.h"
#include "Log.h"
#include "Util.h"

static const char* LINKFILE_SIGNATURE = "channelget link file version ";
static const int LINKFILE_VERSION = 1;
static const char* PENDING_EXTENSION = ".link";
static const char* BROKEN_EXTENSION = ".broken";

const int LinkQueue::ENTRY_NAME_LEN;

CString ItemDescriptor::GetEntryName()
{
	return LinkQueue::EntryName(m_channel, m_id);
}

CString LinkQueue::EntryName(const char* channel, const char* id)
{
	CString key = CString::FormatStr("%s\n%s", channel, id);
	CString hash = Util::Sha1Hex(key, key.Length());
	return CString(hash, ENTRY_NAME_LEN);
}

CString LinkQueue::PendingFilename(const char* name)
{
	return CString::FormatStr("%s%c%s%s", *m_queueDir, PATH_SEPARATOR, name, PENDING_EXTENSION);
}

CString LinkQueue::BrokenFilename(const char* name)
{
	return CString::FormatStr("%s%c%s%s", *m_queueDir, PATH_SEPARATOR, name, BROKEN_EXTENSION);
}

// line breaks would split the record
static CString SingleLine(const char* value)
{
	CString result = value ? value : "";
	for (char* p = result; p && *p; p++)
	{
		if (*p == '\n' || *p == '\r')
		{
			*p = ' ';
		}
	}
	return result;
}

LinkQueue::EEnqueueResult LinkQueue::Enqueue(ItemDescriptor& item, CString& errmsg)
{
	CString name = item.GetEntryName();

	if (Exists(name) || IsBroken(name))
	{
		debug("Entry %s for %s already queued", *name, item.GetId());
		return erExists;
	}

	CString filename = PendingFilename(name);
	StateFile stateFile(filename, LINKFILE_SIGNATURE, LINKFILE_VERSION);
	stateFile.SetExclusive(true);
	StateDiskFile* outfile = stateFile.BeginWrite();
	if (!outfile)
	{
		errmsg = stateFile.GetErrMsg();
		return erFailed;
	}

	outfile->PrintLine("channel=%s", *SingleLine(item.GetChannel()));
	outfile->PrintLine("id=%s", *SingleLine(item.GetId()));
	outfile->PrintLine("title=%s", *SingleLine(item.GetTitle()));
	outfile->PrintLine("url=%s", *SingleLine(item.GetUrl()));
	outfile->PrintLine("ordinal=%i", item.GetOrdinal());
	outfile->PrintLine("max_height=%i", item.GetMaxHeight());
	outfile->PrintLine("target_folder=%s", *SingleLine(item.GetTargetFolder()));
	outfile->PrintLine("subtitle_languages=%s", *SingleLine(item.GetSubtitleLanguages()));
	outfile->PrintLine("browser_profile=%s", *SingleLine(item.GetBrowserProfile()));
	outfile->PrintLine("symlink_dir=%s", *SingleLine(item.GetSymlinkDir()));

	if (!stateFile.FinishWrite())
	{
		if (stateFile.GetDestExists())
		{
			debug("Entry %s for %s was queued meanwhile", *name, item.GetId());
			return erExists;
		}
		errmsg = stateFile.GetErrMsg();
		return erFailed;
	}

	// marked broken between the check above and the publishing
	if (IsBroken(name))
	{
		debug("Entry %s for %s was marked broken meanwhile", *name, item.GetId());
		FileSystem::DeleteFile(filename);
		return erExists;
	}

	return erCreated;
}

bool LinkQueue::Load(const char* name, ItemDescriptor& item, CString& errmsg)
{
	StateFile stateFile(PendingFilename(name), LINKFILE_SIGNATURE, LINKFILE_VERSION);
	StateDiskFile* infile = stateFile.BeginRead();
	if (!infile)
	{
		errmsg = stateFile.GetErrMsg();
		return false;
	}

	char buf[4096];
	while (infile->ReadLine(buf, sizeof(buf)))
	{
		char* value = strchr(buf, '=');
		if (!value)
		{
			continue;
		}
		*value++ = '\0';

		if (!strcmp(buf, "channel")) item.SetChannel(value);
		else if (!strcmp(buf, "id")) item.SetId(value);
		else if (!strcmp(buf, "title")) item.SetTitle(value);
		else if (!strcmp(buf, "url")) item.SetUrl(value);
		else if (!strcmp(buf, "ordinal")) item.SetOrdinal(atoi(value));
		else if (!strcmp(buf, "max_height")) item.SetMaxHeight(atoi(value));
		else if (!strcmp(buf, "target_folder")) item.SetTargetFolder(value);
		else if (!strcmp(buf, "subtitle_languages")) item.SetSubtitleLanguages(value);
		else if (!strcmp(buf, "browser_profile")) item.SetBrowserProfile(value);
		else if (!strcmp(buf, "symlink_dir")) item.SetSymlinkDir(value);
	}
	infile->Close();

	if (Util::EmptyStr(item.GetUrl()))
	{
		errmsg.Format("queue entry %s has no url", name);
		return false;
	}

	return true;
}

LinkQueue::NameList LinkQueue::List(const char* extension)
{
	NameList names;
	int extLen = strlen(extension);

	DirBrowser dir(m_queueDir);
	while (const char* filename = dir.Next())
	{
		int len = strlen(filename);
		if (len > extLen && !strcmp(filename + len - extLen, extension))
		{
			names.emplace_back(filename, len - extLen);
		}
	}

	return names;
}

LinkQueue::NameList LinkQueue::ListPending()
{
	return List(PENDING_EXTENSION);
}

LinkQueue::NameList LinkQueue::ListBroken()
{
	return List(BROKEN_EXTENSION);
}

bool LinkQueue::Exists(const char* name)
{
	return FileSystem::FileExists(PendingFilename(name));
}

bool LinkQueue::IsBroken(const char* name)
{
	return FileSystem::FileExists(BrokenFilename(name));
}

bool LinkQueue::MarkDone(const char* name, CString& errmsg)
{
	CString filename = PendingFilename(name);
	if (unlink(filename) != 0)
	{
		if (errno == ENOENT)
		{
			debug("Entry %s vanished before completion", name);
			errmsg = nullptr;
		}
		else
		{
			errmsg.Format("could not delete file %s: %s", *filename, *FileSystem::GetLastErrorMessage());
		}
		return false;
	}

	CString flushErr;
	if (!FileSystem::FlushDirBuffers(filename, flushErr))
	{
		warn("Could not flush directory buffers for file %s into disk: %s", *filename, *flushErr);
	}

	return true;
}

bool LinkQueue::MarkBroken(const char* name, CString& errmsg)
{
	CString filename = PendingFilename(name);
	CString brokenFilename = BrokenFilename(name);
	if (rename(filename, brokenFilename) != 0)
	{
		if (errno == ENOENT)
		{
			debug("Entry %s vanished before it could be marked broken", name);
			errmsg = nullptr;
		}
		else
		{
			errmsg.Format("could not rename file %s to %s: %s", *filename, *brokenFilename,
				*FileSystem::GetLastErrorMessage());
		}
		return false;
	}

	CString flushErr;
	if (!FileSystem::FlushDirBuffers(brokenFilename, flushErr))
	{
		warn("Could not flush directory buffers for file %s into disk: %s", *brokenFilename, *flushErr);
	}

	return true;
}

CString LinkQueue::ResolveEntry(const char* nameOrPath)
{
	BString<1024> name = FileSystem::BaseFileName(nameOrPath);
	int extLen = strlen(PENDING_EXTENSION);
	if (name.Length() > extLen && !strcmp(name + name.Length() - extLen, PENDING_EXTENSION))
	{
		name[name.Length() - extLen] = '\0';
	}
	return *name;
}
