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
#include "catch.hpp"

#include "Util.h"
#include "FileSystem.h"
#include "TestUtil.h"

bool TestUtil::m_usedWorkingDir = false;
std::string DataDir;

void TestUtil::Init(const char* argv0)
{
	m_usedWorkingDir = false;

	const char* envDir = getenv("CHANNELGET_TESTDATA");
	if (envDir && FileSystem::DirectoryExists(envDir))
	{
		DataDir = envDir;
		return;
	}

	CString filename = FileSystem::GetExeFileName(argv0);
	FileSystem::NormalizePathSeparators(filename);
	char* end = strrchr(filename, PATH_SEPARATOR);
	if (end) *end = '\0';
	DataDir = filename;
	DataDir += "/testdata";
	if (!FileSystem::DirectoryExists(DataDir.c_str()))
	{
		DataDir = filename;
		DataDir += "/tests/testdata";
	}
	if (!FileSystem::DirectoryExists(DataDir.c_str()))
	{
		DataDir = filename;
		DataDir += "/../tests/testdata";
	}
	if (!FileSystem::DirectoryExists(DataDir.c_str()))
	{
		DataDir = "";
	}
}

void TestUtil::Final()
{
	if (m_usedWorkingDir)
	{
		CleanupWorkingDir();
	}
}

const std::string TestUtil::TestDataDir()
{
	if (DataDir == "")
	{
		printf("ERROR: Directory \"testdata\" not found.\n");
		exit(1);
	}
	return DataDir;
}

const std::string TestUtil::WorkingDir()
{
	return TestDataDir() + "/temp";
}

void TestUtil::PrepareWorkingDir()
{
	m_usedWorkingDir = true;

	std::string workDir = WorkingDir();

	CString errmsg;
	int retries = 20;

	FileSystem::DeleteDirectoryWithContent(workDir.c_str(), errmsg);
	while (FileSystem::DirectoryExists(workDir.c_str()) && retries > 0)
	{
		Util::Sleep(100);
		retries--;
		FileSystem::DeleteDirectoryWithContent(workDir.c_str(), errmsg);
	}
	REQUIRE_FALSE(FileSystem::DirectoryExists(workDir.c_str()));
	FileSystem::CreateDirectory(workDir.c_str());
	REQUIRE(FileSystem::DirEmpty(workDir.c_str()));
}

void TestUtil::CleanupWorkingDir()
{
	CString errmsg;
	FileSystem::DeleteDirectoryWithContent(WorkingDir().c_str(), errmsg);
}

void TestUtil::WriteFile(const std::string filename, const std::string content)
{
	REQUIRE(FileSystem::SaveBufferIntoFile(filename.c_str(), content.c_str(), (int)content.length()));
}

std::string TestUtil::ReadFile(const std::string filename)
{
	CharBuffer buffer;
	REQUIRE(FileSystem::LoadFileIntoBuffer(filename.c_str(), buffer, true));
	return std::string(buffer);
}

int TestUtil::CountFiles(const std::string dir, const char* extension)
{
	int count = 0;
	int extLen = (int)strlen(extension);
	DirBrowser browser(dir.c_str());
	while (const char* filename = browser.Next())
	{
		int len = (int)strlen(filename);
		if (len > extLen && !strcmp(filename + len - extLen, extension))
		{
			count++;
		}
	}
	return count;
}
