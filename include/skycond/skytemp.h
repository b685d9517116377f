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

#ifndef __SKYCOND_SKYTEMP__
#define __SKYCOND_SKYTEMP__

/* sky temperature correction model, manufacturer defaults */
#define SKYCOND_K1  33.
#define SKYCOND_K2   0.
#define SKYCOND_K3   0.
#define SKYCOND_K4   0.
#define SKYCOND_K5   0.
#define SKYCOND_K6 140.
#define SKYCOND_K7  40.

/* cloud states boundaries */
#define SKYCOND_CLEAR_LIMIT  -17. /* deg C */
#define SKYCOND_CLOUD_LIMIT   -8. /* deg C */

namespace skycond
{

/**
 * Coefficients of the empirical drift model of the IR sensor. Each sensor is
 * calibrated with its own K1..K7 values. K1 and K2 drive linear term, K3..K5
 * exponential term and K6, K7 logarithmic term.
 *
 * @author Markus Wildi <markus.wildi@one-arcsec.org>
 */
struct SkyCoefficients
{
	/**
	 * Construct coefficients with manufacturer defaults.
	 */
	SkyCoefficients ()
	{
		K1 = SKYCOND_K1;
		K2 = SKYCOND_K2;
		K3 = SKYCOND_K3;
		K4 = SKYCOND_K4;
		K5 = SKYCOND_K5;
		K6 = SKYCOND_K6;
		K7 = SKYCOND_K7;
	}

	SkyCoefficients (double _K1, double _K2, double _K3, double _K4, double _K5, double _K6, double _K7)
	{
		K1 = _K1;
		K2 = _K2;
		K3 = _K3;
		K4 = _K4;
		K5 = _K5;
		K6 = _K6;
		K7 = _K7;
	}

	double K1;
	double K2;
	double K3;
	double K4;
	double K5;
	double K6;
	double K7;
};

/**
 * Cloud states. Ordered, higher value means more clouds.
 */
enum CloudState
{
	CLOUD_CLEAR = 0,
	CLOUD_CLOUDY = 1,
	CLOUD_VERY_CLOUDY = 2
};

/**
 * Boundaries between cloud states.
 */
struct CloudLimits
{
	CloudLimits ()
	{
		clear = SKYCOND_CLEAR_LIMIT;
		cloudy = SKYCOND_CLOUD_LIMIT;
	}

	CloudLimits (double _clear, double _cloudy)
	{
		clear = _clear;
		cloudy = _cloudy;
	}

	// below this value sky is clear
	double clear;
	// above this value sky is very cloudy
	double cloudy;
};

/**
 * Linear part of the drift, (K1/100) * (ta - K2/10).
 *
 * @param ta  ambient temperature [deg C]
 * @param c   model coefficients
 */
double skyDriftLinear (double ta, const SkyCoefficients &c);

/**
 * Exponential part of the drift, (K3/100) * exp(K4/1000 * ta) ^ (K5/100).
 * Returns 0 if K3 is 0. Overflow of the exponential is treated as 0, NaN is
 * propagated.
 *
 * @param ta  ambient temperature [deg C]
 * @param c   model coefficients
 */
double skyDriftExponential (double ta, const SkyCoefficients &c);

/**
 * Logarithmic part of the drift. Within 1 deg C of K2/10 the logarithm is
 * replaced by the distance from K2/10, signed as K6.
 *
 * @param ta  ambient temperature [deg C]
 * @param c   model coefficients
 */
double skyDriftLogarithmic (double ta, const SkyCoefficients &c);

/**
 * Drift of the sensor at given ambient temperature, sum of the linear,
 * exponential and logarithmic parts.
 *
 * @param ta  ambient temperature [deg C]
 * @param c   model coefficients
 *
 * @return drift term T_d [deg C]
 */
double skyDrift (double ta, const SkyCoefficients &c);

/**
 * Corrected sky temperature.
 *
 * @param ts  raw sky temperature from the IR sensor [deg C]
 * @param ta  ambient (IR sensor housing) temperature [deg C]
 * @param c   model coefficients
 *
 * @return ts - skyDrift (ta, c) [deg C]
 */
double skyTemperatureCorrected (double ts, double ta, const SkyCoefficients &c);

/**
 * Classify corrected sky temperature. Values equal to either limit are
 * CLOUD_CLOUDY. Limits are not checked for ordering.
 *
 * @param tsky         corrected sky temperature [deg C]
 * @param clear_limit  below this value sky is clear
 * @param cloud_limit  above this value sky is very cloudy
 */
CloudState classifyCloudState (double tsky, double clear_limit = SKYCOND_CLEAR_LIMIT, double cloud_limit = SKYCOND_CLOUD_LIMIT);

CloudState classifyCloudState (double tsky, const CloudLimits &limits);

/**
 * Returns cloud state name - CLEAR, CLOUDY or VERY_CLOUDY.
 */
const char *cloudStateName (CloudState state);

/**
 * Parse cloud state name, as returned by cloudStateName.
 *
 * @return -1 on unknown name, 0 on success
 */
int cloudStateFromName (const char *name, CloudState &state);

}

#endif /* !__SKYCOND_SKYTEMP__ */
