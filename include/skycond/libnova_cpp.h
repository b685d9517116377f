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

#ifndef __SKYCOND_LIBNOVA_CPP__
#define __SKYCOND_LIBNOVA_CPP__

#include <libnova/libnova.h>
#include <math.h>
#include <istream>
#include <ostream>

namespace skycond
{

/**
 * Angle in degrees. Prints as [+-]DDD:MM:SS.ss, reads either decimal
 * degrees or [+-]DD:MM:SS.ss.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class LibnovaDeg
{
	public:
		LibnovaDeg () { deg = NAN; }
		LibnovaDeg (double in_deg) { deg = in_deg; }

		double getDeg () { return deg; }

		friend std::ostream & operator << (std::ostream & _os, LibnovaDeg l_deg);

		/**
		 * Read one whitespace separated token. Sets failbit and leaves
		 * value NaN if the token is not an angle.
		 */
		friend std::istream & operator >> (std::istream & _is, LibnovaDeg & l_deg);

	private:
		double deg;
};

/**
 * Observer position, printed as longitude E/W and latitude N/S.
 */
class LibnovaPos
{
	public:
		LibnovaPos (const struct ln_lnlat_posn *in_pos)
		{
			pos.lng = in_pos->lng;
			pos.lat = in_pos->lat;
		}

		friend std::ostream & operator << (std::ostream & _os, LibnovaPos l_pos);

	private:
		struct ln_lnlat_posn pos;
};

std::ostream & operator << (std::ostream & _os, LibnovaDeg l_deg);
std::istream & operator >> (std::istream & _is, LibnovaDeg & l_deg);
std::ostream & operator << (std::ostream & _os, LibnovaPos l_pos);

}

#endif							 /* !__SKYCOND_LIBNOVA_CPP__ */
