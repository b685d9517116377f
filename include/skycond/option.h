/* 
 * Command line option descriptor.
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

#ifndef __SKYCOND_OPTION__
#define __SKYCOND_OPTION__

#include <getopt.h>
#include <string>

// option codes shared by skycond programs
#define OPT_VERSION          999
#define OPT_CONFIG          1001
#define OPT_ENV_FILE        1002
#define OPT_ENVIRONMENT     1003

// first code free for program specific options
#define OPT_LOCAL      10000

namespace skycond
{

/**
 * Single entry of program option table.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class Option
{
	public:
		Option (int in_short_option, const char *in_long_option, int in_has_arg, const char *in_help_msg)
		{
			short_option = in_short_option;
			long_option = in_long_option;
			has_arg = in_has_arg;
			help_msg = in_help_msg;
		}

		/**
		 * Print option help line to stdout.
		 */
		void help ();

		/**
		 * Append option character and argument colons to getopt
		 * option string. Codes outside character range are skipped.
		 */
		void appendShort (std::string &opts);

		bool haveLongOption () { return long_option != NULL; }

		void fillLong (struct option *lo)
		{
			lo->name = long_option;
			lo->has_arg = has_arg;
			lo->flag = NULL;
			lo->val = short_option;
		}

	private:
		int short_option;
		const char *long_option;
		int has_arg;
		const char *help_msg;
};

}

#endif							 /* !__SKYCOND_OPTION__ */
