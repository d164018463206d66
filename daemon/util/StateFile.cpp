/*
 *  This file is part of channelget.
 *
 *  Copyright (C) 2007-2019 Andrey Prygunkov <hugbug@users.sourceforge.net>
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
#include "StateFile.h"
#include "Log.h"

int64 StateDiskFile::PrintLine(const char* format, ...)
{
	va_list ap;
	va_start(ap, format);
	CString str;
	int len = str.FormatV(format, ap);
	va_end(ap);

	str.Append("\n");
	len++;

	return Write(*str, len);
}

char* StateDiskFile::ReadLine(char* buffer, int64 size)
{
	if (!DiskFile::ReadLine(buffer, size))
	{
		return nullptr;
	}

	// remove traling '\n'
	if (*buffer)
	{
		if (buffer[strlen(buffer) - 1] != '\n')
		{
			// the line is longer than "size", scroll file position to the end of the line
			for (char skipbuf[1024]; DiskFile::ReadLine(skipbuf, 1024) && *skipbuf && skipbuf[strlen(skipbuf) - 1] != '\n'; ) ;
		}
		else
		{
			buffer[strlen(buffer) - 1] = 0;
		}
	}

	return buffer;
}


StateFile::StateFile(const char* destFilename, const char* signature, int formatVersion) :
	m_signature(signature), m_formatVersion(formatVersion)
{
	m_destFilename = destFilename;
	m_tempFilename.Format("%s.new", destFilename);
}

/* Parse signature and return format version number
*/
int StateFile::ParseFormatVersion(const char* formatSignature)
{
	if (strncmp(formatSignature, m_signature, m_signature.Length()))
	{
		return 0;
	}

	return atoi(formatSignature + m_signature.Length());
}

StateDiskFile* StateFile::BeginWrite()
{
	if (!m_file.Open(m_tempFilename, StateDiskFile::omWrite))
	{
		m_errmsg.Format("could not create file %s: %s", *m_tempFilename,
			*FileSystem::GetLastErrorMessage());
		return nullptr;
	}

	if (!m_signature.Empty())
	{
		m_file.PrintLine("%s%i", *m_signature, m_formatVersion);
	}

	return &m_file;
}

bool StateFile::FinishWrite()
{
	// flush file content before renaming
	debug("Flushing data for file %s", FileSystem::BaseFileName(m_tempFilename));
	bool written = m_file.Flush() && !m_file.Error();
	CString errmsg;
	if (written && !m_file.Sync(errmsg))
	{
		warn("Could not flush file %s into disk: %s", *m_tempFilename, *errmsg);
	}

	if (m_file.Close() != 0 || !written)
	{
		m_errmsg.Format("could not write file %s: %s", *m_tempFilename, *FileSystem::GetLastErrorMessage());
		FileSystem::DeleteFile(m_tempFilename);
		return false;
	}

	if (m_exclusive)
	{
		// link fails with EEXIST where rename would replace the destination
		int linkResult = link(m_tempFilename, m_destFilename);
		m_destExists = linkResult != 0 && errno == EEXIST;
		if (linkResult != 0)
		{
			m_errmsg.Format("could not link file %s to %s: %s",
				*m_tempFilename, *m_destFilename, *FileSystem::GetLastErrorMessage());
		}
		FileSystem::DeleteFile(m_tempFilename);
		if (linkResult != 0)
		{
			return false;
		}
	}
	// rename replaces the destination atomically
	else if (rename(m_tempFilename, m_destFilename) != 0)
	{
		m_errmsg.Format("could not rename file %s to %s: %s",
			*m_tempFilename, *m_destFilename, *FileSystem::GetLastErrorMessage());
		FileSystem::DeleteFile(m_tempFilename);
		return false;
	}

	// flush directory buffer after renaming
	debug("Flushing directory for file %s", FileSystem::BaseFileName(m_destFilename));
	if (!FileSystem::FlushDirBuffers(m_destFilename, errmsg))
	{
		warn("Could not flush directory buffers for file %s into disk: %s", *m_destFilename, *errmsg);
	}

	return true;
}

void StateFile::AbortWrite()
{
	m_file.Close();
	FileSystem::DeleteFile(m_tempFilename);
}

StateDiskFile* StateFile::BeginRead()
{
	if (!m_file.Open(m_destFilename, StateDiskFile::omRead))
	{
		m_errmsg.Format("could not open file %s: %s", *m_destFilename,
			*FileSystem::GetLastErrorMessage());
		return nullptr;
	}

	if (m_signature.Empty())
	{
		// plain document without signature line
		m_fileVersion = m_formatVersion;
		return &m_file;
	}

	char fileSignature[128];
	if (!m_file.ReadLine(fileSignature, sizeof(fileSignature)))
	{
		fileSignature[0] = '\0';
	}
	m_fileVersion = ParseFormatVersion(fileSignature);
	if (m_fileVersion == 0 || m_fileVersion > m_formatVersion)
	{
		m_errmsg.Format("could not load file %s due to file version mismatch", *m_destFilename);
		m_file.Close();
		return nullptr;
	}

	return &m_file;
}
