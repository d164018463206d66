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
#include "ColoredFrontend.h"
#include "Util.h"

void ColoredFrontend::BeforePrint()
{
	if (m_needGoBack)
	{
		// go back one line
		printf("\r\033[1A");
		m_needGoBack = false;
	}
}

void ColoredFrontend::PrintStatus()
{
	if (m_verbosity == fvQuiet || IsStopped())
	{
		return;
	}

	CString status = GetStatus();
	if (status.Empty())
	{
		return;
	}

	printf(" %s\033[K\n", *status);
	m_needGoBack = true;
}

void ColoredFrontend::PrintMessage(Message& message)
{
	const char* msg = message.GetText();
	switch (message.GetKind())
	{
		case Message::mkDebug:
			printf("[DEBUG] %s\033[K\n", msg);
			break;
		case Message::mkError:
			printf("\033[31m[ERROR]\033[39m %s\033[K\n", msg);
			break;
		case Message::mkWarning:
			printf("\033[35m[WARNING]\033[39m %s\033[K\n", msg);
			break;
		case Message::mkInfo:
			printf("\033[32m[INFO]\033[39m %s\033[K\n", msg);
			break;
		case Message::mkDetail:
			printf("\033[32m[DETAIL]\033[39m %s\033[K\n", msg);
			break;
	}
}

void ColoredFrontend::PrintReport(Report& report)
{
	switch (report.GetKind())
	{
		case Report::rkSuccess:
			printf("\033[32m%s\033[39m\033[K\n", report.GetText());
			break;
		case Report::rkFailure:
			printf("\033[31m%s\033[39m\033[K\n", report.GetText());
			break;
		case Report::rkText:
			printf("%s\033[K\n", report.GetText());
			break;
	}
}

void ColoredFrontend::PrintSkip()
{
	printf(".....\033[K\n");
}

void ColoredFrontend::BeforeExit()
{
	BeforePrint();
	printf("\033[K");
	fflush(stdout);
}
