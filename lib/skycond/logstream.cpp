/* 
 * Streaming interface for log messages.
 * Copyright (C) 2007 Petr Kubanek <petr@kubanek.net>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */

#include "skycond/app.h"
#include "skycond/logstream.h"

#include <iostream>

using namespace skycond;

void LogStream::sendLog ()
{
	if (master != NULL)
	{
		master->sendMessage (messageType, ls.str ().c_str ());
		return;
	}
	// no application, library is used directly
	Message msg ("log", messageType, ls.str ().c_str ());
	std::cerr << msg << std::endl;
}

LogStream & sendLog (LogStream & _ls)
{
	_ls.sendLog ();
	return _ls;
}
