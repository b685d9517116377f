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

#ifndef __SKYCOND_LOGSTREAM__
#define __SKYCOND_LOGSTREAM__

#include <sstream>

#include "skycond/message.h"

namespace skycond
{
class App;

/**
 * Collects log message text. Message is delivered when sendLog
 * manipulator is streamed in. Floating point values are printed with
 * fixed precision.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class LogStream
{
	public:
		LogStream (App * in_master, messageType_t in_type)
		{
			master = in_master;
			messageType = in_type;
			initStream ();
		}

		// message text is not copied
		LogStream (const LogStream &_logStream)
		{
			master = _logStream.master;
			messageType = _logStream.messageType;
			initStream ();
		}

		LogStream & operator << (LogStream & (*func) (LogStream &))
		{
			return func (*this);
		}

		template < typename _charT > LogStream & operator << (_charT value)
		{
			ls << value;
			return *this;
		}

		void sendLog ();

	private:
		App * master;
		messageType_t messageType;
		std::ostringstream ls;

		void initStream ()
		{
			ls.setf (std::ios_base::fixed, std::ios_base::floatfield);
			ls.precision (3);
		}
};

}

/**
 * Manipulator which delivers the message.
 */
skycond::LogStream & sendLog (skycond::LogStream & _ls);

#endif							 /* ! __SKYCOND_LOGSTREAM__ */
