/* 
 * Degree and position streaming with libnova.
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

#include "skycond/libnova_cpp.h"

#include <cmath>
#include <iomanip>
#include <ctype.h>
#include <stdlib.h>
#include <string>

namespace skycond
{

std::ostream & operator << (std::ostream & _os, LibnovaDeg l_deg)
{
	if (std::isnan (l_deg.deg))
	{
		_os << "nan";
		return _os;
	}
	struct ln_dms dms;
	ln_deg_to_dms (l_deg.deg, &dms);

	char old_fill = _os.fill ('0');
	std::streamsize old_precision = _os.precision (2);
	std::ios_base::fmtflags old_flags = _os.flags ();
	_os.setf (std::ios_base::fixed, std::ios_base::floatfield);
	_os << (dms.neg ? '-' : '+')
		<< std::setw (3) << dms.degrees << ":"
		<< std::setw (2) << dms.minutes << ":"
		<< std::setw (5) << dms.seconds;
	_os.flags (old_flags);
	_os.precision (old_precision);
	_os.fill (old_fill);
	return _os;
}

// parse unsigned number from p, ending at end or ':'
static bool parseField (const char *&p, double &val)
{
	char *ep;
	if (*p == '\0' || *p == '-' || *p == '+' || isspace (*p))
		return false;
	val = strtod (p, &ep);
	if (ep == p || !(*ep == '\0' || *ep == ':'))
		return false;
	p = ep;
	return true;
}

std::istream & operator >> (std::istream & _is, LibnovaDeg & l_deg)
{
	std::string token;
	l_deg.deg = NAN;
	if (!(_is >> token))
		return _is;

	const char *p = token.c_str ();
	struct ln_dms dms;
	dms.neg = 0;
	if (*p == '-' || *p == '+')
	{
		dms.neg = (*p == '-');
		p++;
	}

	double d, m = 0, s = 0;
	if (!parseField (p, d))
	{
		_is.setstate (std::ios_base::failbit);
		return _is;
	}
	// decimal degrees
	if (*p == '\0')
	{
		l_deg.deg = dms.neg ? -d : d;
		return _is;
	}
	p++;
	if (!parseField (p, m) || floor (d) != d || d > 360 || m >= 60)
	{
		_is.setstate (std::ios_base::failbit);
		return _is;
	}
	if (*p == ':')
	{
		p++;
		if (!parseField (p, s) || *p != '\0' || floor (m) != m || s >= 60)
		{
			_is.setstate (std::ios_base::failbit);
			return _is;
		}
	}
	dms.degrees = (unsigned short) d;
	dms.minutes = (unsigned short) floor (m);
	dms.seconds = s + (m - floor (m)) * 60;
	l_deg.deg = ln_dms_to_deg (&dms);
	return _is;
}

std::ostream & operator << (std::ostream & _os, LibnovaPos l_pos)
{
	_os << LibnovaDeg (fabs (l_pos.pos.lng)) << (l_pos.pos.lng < 0 ? " W, " : " E, ")
		<< LibnovaDeg (fabs (l_pos.pos.lat)) << (l_pos.pos.lat < 0 ? " S" : " N");
	return _os;
}

}
