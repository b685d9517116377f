/* 
 * Log message.
 * Copyright (C) 2003-2007 Petr Kubanek <petr@kubanek.net>
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

#include "skycond/message.h"

#include <time.h>
#include <iomanip>

using namespace skycond;

Message::Message (const char *in_messageOName, messageType_t in_messageType, const char *in_messageString)
{
	gettimeofday (&messageTime, NULL);
	messageOName = std::string (in_messageOName);
	messageType = in_messageType;
	messageString = std::string (in_messageString);
}

const char * Message::getTypeString ()
{
	switch (messageType)
	{
		case MESSAGE_ERROR:
			return "error";
		case MESSAGE_WARNING:
			return "warning";
		case MESSAGE_INFO:
			return "info";
		case MESSAGE_DEBUG:
			return "debug";
		case MESSAGE_CRITICAL:
			return "critical";
	}
	return "unknown";
}

std::ostream & skycond::operator << (std::ostream & _of, Message & msg)
{
	struct tm gmt;
	char buf[30];
	time_t t = msg.messageTime.tv_sec;

	gmtime_r (&t, &gmt);
	strftime (buf, sizeof (buf), "%Y-%m-%dT%H:%M:%S", &gmt);

	char old_fill = _of.fill ('0');
	_of << buf << "." << std::setw (3) << (msg.messageTime.tv_usec / 1000) << " UT";
	_of.fill (old_fill);

	_of << " " << msg.messageOName << " " << msg.getTypeString () << " " << msg.messageString;
	return _of;
}
