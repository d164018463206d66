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


#ifndef STATEFILE_H
#define STATEFILE_H

#include "NString.h"
#include "FileSystem.h"

class StateDiskFile : public DiskFile
{
public:
	int64 PrintLine(const char* format, ...) PRINTF_SYNTAX(2);
	char* ReadLine(char* buffer, int64 size);
};

/*
Line-oriented state file with a signature line (or without one if the
signature is empty).
Writes go to "<dest>.new" and become visible with a single rename,
readers never observe a partially written file. An exclusive write publishes
with a hard link instead and fails if the destination already exists.
 */
class StateFile
{
public:
	StateFile(const char* destFilename, const char* signature, int formatVersion);
	StateDiskFile* BeginWrite();
	bool FinishWrite();
	void AbortWrite();
	StateDiskFile* BeginRead();
	int GetFileVersion() { return m_fileVersion; }
	const char* GetErrMsg() { return m_errmsg; }
	void SetExclusive(bool exclusive) { m_exclusive = exclusive; }
	bool GetDestExists() { return m_destExists; }

private:
	BString<1024> m_destFilename;
	BString<1024> m_tempFilename;
	CString m_signature;
	int m_formatVersion;
	int m_fileVersion = 0;
	bool m_exclusive = false;
	bool m_destExists = false;
	CString m_errmsg;
	StateDiskFile m_file;

	int ParseFormatVersion(const char* formatSignature);
};

#endif
