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
#include "ChannelConfig.h"
#include "StateFile.h"
#include "Options.h"
#include "Log.h"
#include "Util.h"

static const char* KEY_SOURCE_URL = "source_url";
static const char* KEY_TARGET_FOLDER = "target_folder";
static const char* KEY_MAX_HEIGHT = "max_height";
static const char* KEY_SUBTITLE_LANGUAGES = "subtitle_languages";
static const char* KEY_BROWSER_PROFILE = "browser_profile";
static const char* KEY_SYMLINK_DIR = "symlink_dir";
static const char* KEY_LAST_ITEM_ID = "last_item_id";
static const char* KEY_LAST_DOWNLOAD_INDEX = "last_download_index";

// names used by older versions of channel documents
static const char* LEGACY_KEY_SOURCE_URL = "link";
static const char* LEGACY_KEY_LAST_ITEM_ID = "last_video";

static const char* CHANNEL_EXTENSION = ".conf";

const int ChannelConfig::DEFAULT_MAX_HEIGHT;

ChannelConfig::ChannelConfig(const char* filename) :
	m_filename(filename)
{
	BString<1024> name = FileSystem::BaseFileName(filename);
	int extLen = strlen(CHANNEL_EXTENSION);
	if (name.Length() > extLen && !strcasecmp(name + name.Length() - extLen, CHANNEL_EXTENSION))
	{
		name[name.Length() - extLen] = '\0';
	}
	m_name = name;
}

ChannelConfig::ChannelConfig(const char* name, const char* sourceUrl, const char* targetFolder) :
	m_name(name), m_sourceUrl(sourceUrl), m_targetFolder(targetFolder)
{
}

void ChannelConfig::Reset()
{
	m_sourceUrl = nullptr;
	m_targetFolder = nullptr;
	m_maxHeight = DEFAULT_MAX_HEIGHT;
	m_subtitleLanguages.clear();
	m_browserProfile = nullptr;
	m_symlinkDir = nullptr;
	m_lastItemId = nullptr;
	m_lastDownloadIndex = 0;
	m_otherLines.clear();
	m_errmsg = nullptr;
}

ChannelConfig::ELoadStatus ChannelConfig::Load()
{
	Reset();

	StateFile stateFile(m_filename, "", 1);
	StateDiskFile* infile = stateFile.BeginRead();
	if (!infile)
	{
		m_errmsg = stateFile.GetErrMsg();
		return clError;
	}

	int bufLen = (int)FileSystem::FileSize(m_filename) + 1;
	CharBuffer buf(bufLen < 1024 ? 1024 : bufLen);
	int lineNo = 0;
	bool ok = true;
	while (infile->ReadLine(buf, buf.Size()))
	{
		lineNo++;
		if (!ParseLine(buf, lineNo))
		{
			ok = false;
			break;
		}
	}
	infile->Close();

	if (!ok)
	{
		return clError;
	}

	if (m_sourceUrl.Empty() && m_targetFolder.Empty())
	{
		m_errmsg.Format("%s has neither %s nor %s", FileSystem::BaseFileName(m_filename),
			KEY_SOURCE_URL, KEY_TARGET_FOLDER);
		return clNotChannel;
	}

	return clLoaded;
}

bool ChannelConfig::ParseLine(char* line, int lineNo)
{
	char* text = Util::Trim(line);
	if (*text == '\0' || *text == '#' || *text == '[')
	{
		// comments and section headers are kept as they are
		m_otherLines.emplace_back(line);
		return true;
	}

	CString key;
	CString value;
	if (!Options::SplitOptionString(text, key, value))
	{
		m_errmsg.Format("%s(%i): invalid line \"%s\"", FileSystem::BaseFileName(m_filename), lineNo, text);
		return false;
	}

	CString unquoted = Unquote(value);

	if (!strcmp(key, KEY_SOURCE_URL) || !strcmp(key, LEGACY_KEY_SOURCE_URL))
	{
		m_sourceUrl = *unquoted;
	}
	else if (!strcmp(key, KEY_TARGET_FOLDER))
	{
		m_targetFolder = *unquoted;
	}
	else if (!strcmp(key, KEY_MAX_HEIGHT) || !strcmp(key, KEY_LAST_DOWNLOAD_INDEX))
	{
		char* endptr;
		long num = strtol(unquoted, &endptr, 10);
		if (unquoted.Empty() || *endptr != '\0' || num < 0)
		{
			m_errmsg.Format("%s(%i): invalid value for %s: \"%s\"", FileSystem::BaseFileName(m_filename),
				lineNo, *key, *unquoted);
			return false;
		}
		if (!strcmp(key, KEY_MAX_HEIGHT))
		{
			m_maxHeight = (int)num;
		}
		else
		{
			m_lastDownloadIndex = (int)num;
		}
	}
	else if (!strcmp(key, KEY_SUBTITLE_LANGUAGES))
	{
		ParseList(value, m_subtitleLanguages);
	}
	else if (!strcmp(key, KEY_BROWSER_PROFILE))
	{
		m_browserProfile = *unquoted;
	}
	else if (!strcmp(key, KEY_SYMLINK_DIR))
	{
		m_symlinkDir = *unquoted;
	}
	else if (!strcmp(key, KEY_LAST_ITEM_ID) || !strcmp(key, LEGACY_KEY_LAST_ITEM_ID))
	{
		m_lastItemId = *unquoted;
	}
	else
	{
		m_otherLines.emplace_back(line);
	}

	return true;
}

/*
 * Values may be written in quotes, as in documents converted from toml.
 */
CString ChannelConfig::Unquote(const char* value)
{
	int len = strlen(value);
	if (len >= 2 && ((value[0] == '"' && value[len - 1] == '"') ||
		(value[0] == '\'' && value[len - 1] == '\'')))
	{
		return len == 2 ? CString("") : CString(value + 1, len - 2);
	}
	return value;
}

/*
 * Accepts "pl, en" as well as ["pl", "en"].
 */
void ChannelConfig::ParseList(const char* value, NameList& list)
{
	list.clear();
	Tokenizer tok(value, "[], \"'");
	while (const char* name = tok.Next())
	{
		list.emplace_back(name);
	}
}

CString ChannelConfig::FormatSubtitleLanguages()
{
	CString result;
	for (CString& lang : m_subtitleLanguages)
	{
		if (!result.Empty())
		{
			result.Append(",");
		}
		result.Append(lang);
	}
	return result;
}

void ChannelConfig::SetMarker(const char* lastItemId, int lastDownloadIndex)
{
	m_lastItemId = lastItemId;
	m_lastDownloadIndex = lastDownloadIndex;
}

void ChannelConfig::Advance(const char* lastItemId, int count)
{
	if (count <= 0)
	{
		return;
	}

	m_lastItemId = lastItemId;
	m_lastDownloadIndex += count;
}

bool ChannelConfig::Save()
{
	debug("Saving channel %s", *m_name);

	StateFile stateFile(m_filename, "", 1);
	StateDiskFile* outfile = stateFile.BeginWrite();
	if (!outfile)
	{
		m_errmsg = stateFile.GetErrMsg();
		return false;
	}

	outfile->PrintLine("%s=%s", KEY_SOURCE_URL, *m_sourceUrl);
	outfile->PrintLine("%s=%s", KEY_TARGET_FOLDER, *m_targetFolder);
	outfile->PrintLine("%s=%i", KEY_MAX_HEIGHT, m_maxHeight);
	if (!m_subtitleLanguages.empty())
	{
		outfile->PrintLine("%s=%s", KEY_SUBTITLE_LANGUAGES, *FormatSubtitleLanguages());
	}
	if (!m_browserProfile.Empty())
	{
		outfile->PrintLine("%s=%s", KEY_BROWSER_PROFILE, *m_browserProfile);
	}
	if (!m_symlinkDir.Empty())
	{
		outfile->PrintLine("%s=%s", KEY_SYMLINK_DIR, *m_symlinkDir);
	}
	if (!m_lastItemId.Empty())
	{
		outfile->PrintLine("%s=%s", KEY_LAST_ITEM_ID, *m_lastItemId);
	}
	outfile->PrintLine("%s=%i", KEY_LAST_DOWNLOAD_INDEX, m_lastDownloadIndex);

	for (CString& line : m_otherLines)
	{
		outfile->PrintLine("%s", *line);
	}

	if (!stateFile.FinishWrite())
	{
		m_errmsg = stateFile.GetErrMsg();
		return false;
	}

	return true;
}

bool ChannelLoader::LoadAll(const char* channelDir, ChannelList& channels)
{
	if (!FileSystem::DirectoryExists(channelDir))
	{
		error("Could not read channel directory %s: %s", channelDir, *FileSystem::GetLastErrorMessage());
		return false;
	}

	int extLen = strlen(CHANNEL_EXTENSION);

	DirBrowser dir(channelDir);
	while (const char* filename = dir.Next())
	{
		int len = strlen(filename);
		if (len <= extLen || strcasecmp(filename + len - extLen, CHANNEL_EXTENSION))
		{
			continue;
		}

		BString<1024> fullFilename("%s%c%s", channelDir, PATH_SEPARATOR, filename);
		std::unique_ptr<ChannelConfig> channel = std::make_unique<ChannelConfig>(fullFilename);
		switch (channel->Load())
		{
			case ChannelConfig::clLoaded:
				channels.push_back(std::move(channel));
				break;

			case ChannelConfig::clNotChannel:
				warn("Skipping %s: %s", *fullFilename, channel->GetErrMsg());
				break;

			case ChannelConfig::clError:
				// reported again for this channel by discovery
				error("Could not load channel %s: %s", channel->GetName(), channel->GetErrMsg());
				channels.push_back(std::move(channel));
				break;
		}
	}

	std::sort(channels.begin(), channels.end(),
		[](const std::unique_ptr<ChannelConfig>& a, const std::unique_ptr<ChannelConfig>& b)
		{
			return strcmp(a->GetName(), b->GetName()) < 0;
		});

	return true;
}
