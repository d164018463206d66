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

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "Thread.h"
#include "Log.h"
#include "Options.h"
#include "Util.h"
#include "FileSystem.h"
#include "TestMain.h"
#include "TestUtil.h"

#ifdef STANDALONE_TESTS
Log* g_Log;
Options* g_Options;

void ExitProc()
{
}

int main(int argc, char* argv[])
{
	Util::Init();

	// "TestMain" expects the program name followed by "-tests"
	char** testsargv = (char**)malloc(sizeof(char*) * (argc + 2));
	char testsArg[] = "-tests";
	testsargv[0] = argv[0];
	testsargv[1] = testsArg;
	for (int i = 1; i < argc; i++)
	{
		testsargv[i+1] = argv[i];
	}
	testsargv[argc+1] = nullptr;

	int ret = TestMain(argc + 1, testsargv);

	free(testsargv);
	return ret;
}
#endif

int TestMain(int argc, char * argv[])
{
	TestUtil::Init(argv[0]);
	Log log;
	Thread::Init();

	if (argc == 1)
	{
		printf("Unit and integration tests for channelget-%s.\nUse '%s -tests [Quick]' to run only quick tests or '%s -h' for more options.\n",
			   Util::VersionRevision(), FileSystem::BaseFileName(argv[0]), FileSystem::BaseFileName(argv[0]));
	}

	// shift arguments for catch to not see the parameter "-tests"
	char** testsargv = (char**)malloc(sizeof(char*) * (argc + 1));
	char firstArg[1024];
	snprintf(firstArg, 1024, "%s %s", argv[0], argv[1]);
	firstArg[1024-1] = '\0';
	testsargv[0] = firstArg;
	for (int i = 2; i < argc; i++)
	{
		testsargv[i-1] = argv[i];
	}
	argc--;
	testsargv[argc] = nullptr;

	int ret = Catch::Session().run(argc, testsargv);

	free(testsargv);
	TestUtil::Final();

	return ret;
}

void TestCleanup()
{
	// If tests were run (via "TestMain") the Catch-framework does clean up automatically.
	// However, if no tests were run, the global objects remain alive and causing memory leak
	// detection reports. Therefore we clean up the Catch-framework when we don't run any tests.
	Catch::cleanUp();
}
