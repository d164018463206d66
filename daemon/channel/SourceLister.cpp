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
#include "SourceLister.h"
#include "YtDlpLister.h"
#include "FixtureLister.h"

std::unique_ptr<SourceLister> SourceLister::Create(Options::ELister kind)
{
	switch (kind)
	{
		case Options::lsFixture:
			return std::make_unique<FixtureLister>();

		case Options::lsYtDlp:
		default:
			return std::make_unique<YtDlpLister>();
	}
}
