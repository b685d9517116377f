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

#include "skycond/option.h"

#include <ctype.h>
#include <iostream>
#include <iomanip>
#include <sstream>

using namespace skycond;

void Option::appendShort (std::string &opts)
{
	if (short_option > 0xff || !isalnum (short_option))
		return;
	opts += (char) short_option;
	// one colon for required, two for optional argument
	for (int i = 0; i < has_arg; i++)
		opts += ':';
}

void Option::help ()
{
	std::ostringstream name;
	if (short_option <= 0xff && isalnum (short_option))
	{
		name << "-" << (char) short_option;
		if (long_option)
			name << "|";
	}
	if (long_option)
		name << "--" << long_option;
	if (has_arg == 1)
		name << " <arg>";
	else if (has_arg == 2)
		name << " [arg]";
	std::cout << "  " << std::left << std::setw (24) << name.str () << " " << help_msg << std::endl;
}
