/* 
 * Exceptions raised by skycond.
 * Copyright (C) 2010 Petr Kubanek, Institute of Physics <kubanek@fzu.cz>
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

#ifndef __SKYCOND_ERROR__
#define __SKYCOND_ERROR__

#include <exception>
#include <string>
#include <ostream>

namespace skycond
{

/**
 * Base of skycond exceptions. App::init catches it and prints it with
 * program usage.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class Error:public std::exception
{
	public:
		explicit Error (const char *_msg):std::exception () { msg = std::string (_msg); }

		Error (const char *_msg, const char *arg):std::exception () { msg = std::string (_msg) + " " + arg; }

		virtual ~Error () throw () {}

		virtual const char* what () const throw () { return msg.c_str (); }

		friend std::ostream & operator << (std::ostream &_os, const Error &_err)
		{
			_os << "error: " << _err.what ();
			return _os;
		}

	private:
		std::string msg;
};

/**
 * Command line argument which should be a number is not.
 */
class ArgumentError:public Error
{
	public:
		ArgumentError (const char *_arg):Error ("cannot parse number", _arg) {}
};

}

#endif /* !__SKYCOND_ERROR__ */
