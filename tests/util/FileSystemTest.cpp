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

#include "catch.hpp"

#include "FileSystem.h"
#include "StateFile.h"
#include "TestUtil.h"

TEST_CASE("FileSystem: MakeValidFilename", "[FileSystem][Quick]")
{
	REQUIRE(!strcmp(FileSystem::MakeValidFilename("20240101 Title: part 1/2"), "20240101 Title_ part 1_2"));
	REQUIRE(!strcmp(FileSystem::MakeValidFilename("alpha/videos", true), "alpha/videos"));
}

TEST_CASE("FileSystem: ForceDirectories", "[FileSystem][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string dir = TestUtil::WorkingDir() + "/media/alpha/season 1";

	CString errmsg;
	REQUIRE(FileSystem::ForceDirectories(dir.c_str(), errmsg));
	REQUIRE(FileSystem::DirectoryExists(dir.c_str()));
	REQUIRE(FileSystem::ForceDirectories(dir.c_str(), errmsg));

	std::string file = TestUtil::WorkingDir() + "/media/plain";
	TestUtil::WriteFile(file, "data");
	REQUIRE_FALSE(FileSystem::ForceDirectories((file + "/sub").c_str(), errmsg));
	REQUIRE_FALSE(errmsg.Empty());
}

TEST_CASE("FileSystem: CreateSymlink", "[FileSystem][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string target = TestUtil::WorkingDir() + "/20240101 Video.mp4";
	std::string target2 = TestUtil::WorkingDir() + "/20240102 Video.mp4";
	std::string link = TestUtil::WorkingDir() + "/latest.mp4";
	TestUtil::WriteFile(target, "first");
	TestUtil::WriteFile(target2, "second");

	CString errmsg;
	REQUIRE(FileSystem::CreateSymlink(target.c_str(), link.c_str(), errmsg));
	REQUIRE(TestUtil::ReadFile(link) == "first");

	// an existing link is replaced
	REQUIRE(FileSystem::CreateSymlink(target2.c_str(), link.c_str(), errmsg));
	REQUIRE(TestUtil::ReadFile(link) == "second");

	// a regular file is never overwritten
	REQUIRE_FALSE(FileSystem::CreateSymlink(target.c_str(), target2.c_str(), errmsg));
	REQUIRE(TestUtil::ReadFile(target2) == "second");
}

TEST_CASE("FileSystem: FileLock", "[FileSystem][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string filename = TestUtil::WorkingDir() + "/alpha.conf";

	{
		FileLock lock(filename.c_str());
		REQUIRE(lock.Locked());
		REQUIRE(FileSystem::FileExists((filename + ".lock").c_str()));
	}

	// released with the object, can be taken again
	FileLock lock2(filename.c_str());
	REQUIRE(lock2.Locked());

	FileLock lock3((TestUtil::WorkingDir() + "/missing/alpha.conf").c_str());
	REQUIRE_FALSE(lock3.Locked());
	REQUIRE(strstr(lock3.GetErrMsg(), "could not open lock-file"));
}

TEST_CASE("StateFile: write and read", "[StateFile][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string filename = TestUtil::WorkingDir() + "/state";

	{
		StateFile stateFile(filename.c_str(), "channelget state file version ", 2);
		StateDiskFile* outfile = stateFile.BeginWrite();
		REQUIRE(outfile);
		outfile->PrintLine("%s", "v5");
		outfile->PrintLine("%i", 42);
		REQUIRE_FALSE(FileSystem::FileExists(filename.c_str()));
		REQUIRE(stateFile.FinishWrite());
	}

	REQUIRE(FileSystem::FileExists(filename.c_str()));
	REQUIRE_FALSE(FileSystem::FileExists((filename + ".new").c_str()));

	StateFile stateFile(filename.c_str(), "channelget state file version ", 2);
	StateDiskFile* infile = stateFile.BeginRead();
	REQUIRE(infile);
	REQUIRE(stateFile.GetFileVersion() == 2);
	char buf[100];
	REQUIRE(infile->ReadLine(buf, sizeof(buf)));
	REQUIRE(!strcmp(buf, "v5"));
	REQUIRE(infile->ReadLine(buf, sizeof(buf)));
	REQUIRE(!strcmp(buf, "42"));
	REQUIRE_FALSE(infile->ReadLine(buf, sizeof(buf)));
}

TEST_CASE("StateFile: version mismatch and abort", "[StateFile][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string filename = TestUtil::WorkingDir() + "/state";
	TestUtil::WriteFile(filename, "channelget state file version 3\nv1\n");

	StateFile newer(filename.c_str(), "channelget state file version ", 2);
	REQUIRE_FALSE(newer.BeginRead());
	REQUIRE(strstr(newer.GetErrMsg(), "version mismatch"));

	StateFile plain(filename.c_str(), "", 1);
	StateDiskFile* outfile = plain.BeginWrite();
	REQUIRE(outfile);
	outfile->PrintLine("partial");
	plain.AbortWrite();
	REQUIRE_FALSE(FileSystem::FileExists((filename + ".new").c_str()));
	REQUIRE(TestUtil::ReadFile(filename) == "channelget state file version 3\nv1\n");
}

TEST_CASE("StateFile: exclusive write", "[StateFile][Quick]")
{
	TestUtil::PrepareWorkingDir();
	std::string filename = TestUtil::WorkingDir() + "/entry";

	StateFile first(filename.c_str(), "", 1);
	first.SetExclusive(true);
	StateDiskFile* outfile = first.BeginWrite();
	REQUIRE(outfile);
	outfile->PrintLine("first");
	REQUIRE(first.FinishWrite());
	REQUIRE_FALSE(first.GetDestExists());

	StateFile second(filename.c_str(), "", 1);
	second.SetExclusive(true);
	outfile = second.BeginWrite();
	REQUIRE(outfile);
	outfile->PrintLine("second");
	REQUIRE_FALSE(second.FinishWrite());
	REQUIRE(second.GetDestExists());

	REQUIRE(TestUtil::ReadFile(filename) == "first\n");
	REQUIRE_FALSE(FileSystem::FileExists((filename + ".new").c_str()));
}
