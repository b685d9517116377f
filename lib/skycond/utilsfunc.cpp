/* 
 * String and unit helpers.
 * Copyright (C) 2005-2007 Petr Kubanek <petr@kubanek.net>
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

#include "skycond/utilsfunc.h"

#include <ctype.h>
#include <strings.h>

std::vector <std::string> skycond::SplitStr (const std::string &text, const std::string &delimiter)
{
	std::vector <std::string> result;
	if (delimiter.empty ())
	{
		if (!text.empty ())
			result.push_back (text);
		return result;
	}

	size_t start = 0;
	while (start <= text.length ())
	{
		size_t pos = text.find (delimiter, start);
		if (pos == std::string::npos)
			pos = text.length ();
		if (pos > start)
			result.push_back (text.substr (start, pos - start));
		start = pos + delimiter.length ();
	}
	return result;
}

std::string skycond::toUpper (const std::string &text)
{
	std::string ret (text);
	for (std::string::iterator iter = ret.begin (); iter != ret.end (); iter++)
		*iter = toupper (*iter);
	return ret;
}

static const char *trueNames[] = { "y", "yes", "true", "on", "1", NULL };
static const char *falseNames[] = { "n", "no", "false", "off", "0", NULL };

int skycond::charToBool (const char *in_value, bool &ret)
{
	const char **n;
	for (n = trueNames; *n; n++)
	{
		if (!strcasecmp (in_value, *n))
		{
			ret = true;
			return 0;
		}
	}
	for (n = falseNames; *n; n++)
	{
		if (!strcasecmp (in_value, *n))
		{
			ret = false;
			return 0;
		}
	}
	return -1;
}
