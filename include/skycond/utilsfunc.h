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

#ifndef __SKYCOND_UTILSFUNC__
#define __SKYCOND_UTILSFUNC__

#include <string>
#include <vector>

namespace skycond
{

/**
 * Split string on delimiter. Empty items are skipped, so repeated
 * delimiters count as one.
 */
std::vector <std::string> SplitStr (const std::string &text, const std::string &delimiter);

std::string toUpper (const std::string &text);

/**
 * Convert string to boolean. Case insensitive y, yes, true, on, 1 and
 * n, no, false, off, 0.
 *
 * @return -1 if string is not a boolean, 0 on success
 */
int charToBool (const char *in_value, bool &ret);

inline double celsiusToFahrenheit (double t) { return t * 9. / 5. + 32.; }

}

#endif /* !__SKYCOND_UTILSFUNC__ */
