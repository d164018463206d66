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




#ifndef SHUTDOWNWATCHER_H
#define SHUTDOWNWATCHER_H

#include "Thread.h"

/*
Carries a shutdown request from a signal handler to the program. The handler
only raises an atomic flag, the watcher thread then runs the shutdown function
once, outside of signal context.
 */
class ShutdownWatcher : public Thread
{
public:
	typedef std::function<void()> ShutdownFunc;

	ShutdownWatcher(ShutdownFunc shutdown, int interval = 100) :
		m_shutdown(shutdown), m_interval(interval) {}
	void RequestShutdown() { m_requested = true; }
	bool GetRequested() { return m_requested; }
	virtual void Stop();

protected:
	virtual void Run();

private:
	ShutdownFunc m_shutdown;
	int m_interval;
	std::atomic<bool> m_requested{false};
	bool m_handled = false;
	Mutex m_waitMutex;
	ConditionVar m_waitCond;
};

#endif
