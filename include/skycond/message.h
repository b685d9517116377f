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

#ifndef __SKYCOND_MESSAGE__
#define __SKYCOND_MESSAGE__

#include <sys/time.h>
#include <stdint.h>

#include <string>
#include <ostream>

typedef uint32_t messageType_t;

#define MESSAGE_ERROR                   0x000001
#define MESSAGE_WARNING                 0x000002
#define MESSAGE_INFO                    0x000004
#define MESSAGE_DEBUG                   0x000008
#define MESSAGE_CRITICAL                0x000010

namespace skycond
{

/**
 * Log message with time of its creation, name of the program which
 * created it, severity and text.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class Message
{
	public:
		Message (const char *in_messageOName, messageType_t in_messageType, const char *in_messageString);

		const char *getTypeString ();

		/**
		 * Print message as "<ISO time> UT <program> <type> <text>".
		 */
		friend std::ostream & operator << (std::ostream & _of, Message & msg);

	private:
		struct timeval messageTime;
		std::string messageOName;
		messageType_t messageType;
		std::string messageString;
};

std::ostream & operator << (std::ostream & _of, Message & msg);

}

#endif							 /* ! __SKYCOND_MESSAGE__ */
