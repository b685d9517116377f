/* 
 * Sky temperature correction and cloud classification for the AAG cloud sensor.
 * Copyright (C) 2009, Markus Wildi, Petr Kubanek <petr@kubanek.net>
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

#include "skycond/skytemp.h"

#include <cmath>
#include <strings.h>

using namespace skycond;

double skycond::skyDriftLinear (double ta, const SkyCoefficients &c)
{
	return c.K1 / 100. * (ta - c.K2 / 10.);
}

double skycond::skyDriftExponential (double ta, const SkyCoefficients &c)
{
	if (c.K3 == 0)
		return 0;

	double e = exp (c.K4 / 1000. * ta);
	if (std::isinf (e))
		return 0;

	double p = pow (e, c.K5 / 100.);
	if (std::isinf (p))
		return 0;

	return c.K3 / 100. * p;
}

double skycond::skyDriftLogarithmic (double ta, const SkyCoefficients &c)
{
	double delta = fabs (c.K2 / 10. - ta);

	// no log10 close to K2/10
	if (delta < 1)
		return copysign (delta, c.K6);

	return c.K6 / 10. * copysign (1., ta - c.K2 / 10.) * (log10 (delta) + c.K7 / 100.);
}

double skycond::skyDrift (double ta, const SkyCoefficients &c)
{
	return skyDriftLinear (ta, c) + skyDriftExponential (ta, c) + skyDriftLogarithmic (ta, c);
}

double skycond::skyTemperatureCorrected (double ts, double ta, const SkyCoefficients &c)
{
	return ts - skyDrift (ta, c);
}

CloudState skycond::classifyCloudState (double tsky, double clear_limit, double cloud_limit)
{
	if (tsky < clear_limit)
		return CLOUD_CLEAR;
	if (tsky > cloud_limit)
		return CLOUD_VERY_CLOUDY;
	return CLOUD_CLOUDY;
}

CloudState skycond::classifyCloudState (double tsky, const CloudLimits &limits)
{
	return classifyCloudState (tsky, limits.clear, limits.cloudy);
}

const char * skycond::cloudStateName (CloudState state)
{
	switch (state)
	{
		case CLOUD_CLEAR:
			return "CLEAR";
		case CLOUD_CLOUDY:
			return "CLOUDY";
		case CLOUD_VERY_CLOUDY:
			return "VERY_CLOUDY";
	}
	return "UNKNOWN";
}

int skycond::cloudStateFromName (const char *name, CloudState &state)
{
	if (!strcasecmp (name, "CLEAR"))
		state = CLOUD_CLEAR;
	else if (!strcasecmp (name, "CLOUDY"))
		state = CLOUD_CLOUDY;
	else if (!strcasecmp (name, "VERY_CLOUDY"))
		state = CLOUD_VERY_CLOUDY;
	else
		return -1;
	return 0;
}
