/* 
 * Configuration file read routines.
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

#include <cmath>
#include <string.h>
#include <strings.h>
#include <sstream>
#include <algorithm>

#include "skycond/configuration.h"
#include "skycond/libnova_cpp.h"
#include "skycond/app.h"

using namespace skycond;

Configuration *Configuration::pInstance = NULL;

int Configuration::getSpecialValues ()
{
	int ret = 0;
	std::string units_str;

	// [weather] top level values
	getString ("weather", "serial_port", serialPort, "/dev/ttyUSB0");
	getDouble ("weather", "safety_delay", safetyDelay, 15);
	getDouble ("weather", "capture_delay", captureDelay, 30);
	getInteger ("weather", "num_readings", numReadings, 10);
	getDouble ("weather", "sq_reference", sqReference, 19.6);
	ignoreUnsafe.clear ();
	getStringVector ("weather", "ignore_unsafe", ignoreUnsafe, false);
	verboseLogging = getBoolean ("weather", "verbose_logging", false);
	getDouble ("weather", "serial_port_open_delay_seconds", serialPortOpenDelay, 1);
	getString ("weather", "solo_data_file_path", soloDataFilePath, "./");
	haveHeater = getBoolean ("weather", "have_heater", false);

	getString ("weather", "units", units_str, getUnitsName (UNITS_METRIC));
	if (!strcasecmp (units_str.c_str (), getUnitsName (UNITS_METRIC)))
	{
		units = UNITS_METRIC;
	}
	else if (!strcasecmp (units_str.c_str (), getUnitsName (UNITS_IMPERIAL)))
	{
		units = UNITS_IMPERIAL;
	}
	else if (!strcasecmp (units_str.c_str (), getUnitsName (UNITS_NONE)))
	{
		units = UNITS_NONE;
	}
	else
	{
		logStream (MESSAGE_ERROR) << "invalid units '" << units_str << "', expected metric, imperial or none" << sendLog;
		units = UNITS_METRIC;
		ret--;
	}

	// out of range values are kept, only a warning is logged
	if (numReadings <= 0)
		logStream (MESSAGE_WARNING) << "num_readings should be positive, is " << numReadings << sendLog;
	checkRange ("weather", "safety_delay", safetyDelay, 0, INFINITY);
	checkRange ("weather", "capture_delay", captureDelay, 0, INFINITY);
	checkRange ("weather", "serial_port_open_delay_seconds", serialPortOpenDelay, 0, INFINITY);

	for (std::vector <std::string>::iterator iter = ignoreUnsafe.begin (); iter != ignoreUnsafe.end (); iter++)
	{
		if (*iter != "rain" && *iter != "cloud" && *iter != "gust" && *iter != "wind")
			logStream (MESSAGE_WARNING) << "unknown condition '" << *iter << "' in ignore_unsafe" << sendLog;
	}

	// thresholds
	getDouble ("thresholds", "cloudy", thresholds.cloudy, -25);
	getDouble ("thresholds", "very_cloudy", thresholds.veryCloudy, -15);
	getDouble ("thresholds", "windy", thresholds.windy, 50);
	getDouble ("thresholds", "very_windy", thresholds.veryWindy, 75);
	getDouble ("thresholds", "gusty", thresholds.gusty, 100);
	getDouble ("thresholds", "very_gusty", thresholds.veryGusty, 125);
	getInteger ("thresholds", "wet", thresholds.wet, 2200);
	getInteger ("thresholds", "rainy", thresholds.rainy, 1800);

	if (thresholds.cloudy > thresholds.veryCloudy)
		logStream (MESSAGE_WARNING) << "thresholds cloudy " << thresholds.cloudy << " is above very_cloudy " << thresholds.veryCloudy << ", cloud states will be inverted" << sendLog;

	// heater
	getDouble ("heater", "rain_threshold_freq", heater.rainThresholdFreq, 30);
	getDouble ("heater", "pwm_max", heater.pwmMax, 70);
	getDouble ("heater", "pwm_mid", heater.pwmMid, 40);
	getDouble ("heater", "pwm_low", heater.pwmLow, 15);
	getDouble ("heater", "hysteresis", heater.hysteresis, 5);
	getDouble ("heater", "low_temp", heater.lowTemp, 0);
	getDouble ("heater", "low_delta", heater.lowDelta, 6);
	getDouble ("heater", "high_temp", heater.highTemp, 20);
	getDouble ("heater", "high_delta", heater.highDelta, 4);
	getDouble ("heater", "impulse_temp", heater.impulseTemp, 10);
	getDouble ("heater", "impulse_duration", heater.impulseDuration, 60);
	getInteger ("heater", "impulse_cycle", heater.impulseCycle, 600);
	getDouble ("heater", "min_power", heater.minPower, 15);

	checkRange ("heater", "pwm_max", heater.pwmMax, 0, 100);
	checkRange ("heater", "pwm_mid", heater.pwmMid, 0, 100);
	checkRange ("heater", "pwm_low", heater.pwmLow, 0, 100);
	checkRange ("heater", "min_power", heater.minPower, 0, 100);
	checkRange ("heater", "low_delta", heater.lowDelta, 0, INFINITY);
	checkRange ("heater", "high_delta", heater.highDelta, 0, INFINITY);
	checkRange ("heater", "impulse_duration", heater.impulseDuration, 0, INFINITY);
	if (heater.impulseCycle <= 0)
		logStream (MESSAGE_WARNING) << "heater impulse_cycle should be positive, is " << heater.impulseCycle << sendLog;

	// location
	getString ("location", "name", locationName, "AAG CloudWatcher");
	getDouble ("location", "elevation", observatoryAltitude, 60);
	ret += getDegrees ("location", "latitude", observer.lat, 49.054);
	ret += getDegrees ("location", "longitude", observer.lng, -122.82);
	getString ("location", "timezone", timeZone, "America/Vancouver");

	checkRange ("location", "latitude", observer.lat, -90, 90);
	checkRange ("location", "longitude", observer.lng, -180, 180);

	// sky temperature model
	getDouble ("skytemp", "K1", skyCoefficients.K1, SKYCOND_K1);
	getDouble ("skytemp", "K2", skyCoefficients.K2, SKYCOND_K2);
	getDouble ("skytemp", "K3", skyCoefficients.K3, SKYCOND_K3);
	getDouble ("skytemp", "K4", skyCoefficients.K4, SKYCOND_K4);
	getDouble ("skytemp", "K5", skyCoefficients.K5, SKYCOND_K5);
	getDouble ("skytemp", "K6", skyCoefficients.K6, SKYCOND_K6);
	getDouble ("skytemp", "K7", skyCoefficients.K7, SKYCOND_K7);

	if (getConversionErrors () > 0)
		ret--;

	if (ret)
		return -1;

	return IniParser::getSpecialValues ();
}

Configuration::Configuration (bool defaultSection):IniParser (defaultSection)
{
	observer.lat = 0;
	observer.lng = 0;
	observatoryAltitude = 0;
	numReadings = 10;
	units = UNITS_METRIC;

	setEnvironment (SKYCOND_ENV_PREFIX, SKYCOND_TOP_SECTION);
}

Configuration::~Configuration (void)
{
}

Configuration * Configuration::instance ()
{
	if (!pInstance)
		pInstance = new Configuration ();
	return pInstance;
}

int Configuration::loadEnvironment ()
{
	clearSections ();
	return getSpecialValues ();
}

bool Configuration::ignoreUnsafeCondition (const char *condition)
{
	return std::find (ignoreUnsafe.begin (), ignoreUnsafe.end (), std::string (condition)) != ignoreUnsafe.end ();
}

const char * Configuration::getUnitsName (units_t u)
{
	switch (u)
	{
		case UNITS_METRIC:
			return "metric";
		case UNITS_IMPERIAL:
			return "imperial";
		case UNITS_NONE:
			return "none";
	}
	return "unknown";
}

int Configuration::getDegrees (const char *section, const char *valueName, double &value, double defVal)
{
	std::string valbuf;
	if (getString (section, valueName, valbuf, NULL))
	{
		value = defVal;
		return 0;
	}

	LibnovaDeg deg;
	std::istringstream is (valbuf);
	is >> deg;
	if (is.fail () || std::isnan (deg.getDeg ()))
	{
		logStream (MESSAGE_ERROR) << "cannot convert '" << valbuf << "' in section [" << section << "] value '" << valueName << "' to degrees" << sendLog;
		value = defVal;
		return -1;
	}
	// anything left must be blank
	std::string rest;
	is.clear ();
	is >> rest;
	if (rest.length () > 0)
	{
		logStream (MESSAGE_ERROR) << "invalid characters '" << rest << "' after degrees in section [" << section << "] value '" << valueName << "'" << sendLog;
		value = defVal;
		return -1;
	}
	value = deg.getDeg ();
	return 0;
}

void Configuration::checkRange (const char *section, const char *valueName, double value, double min, double max)
{
	if (value < min || value > max)
		logStream (MESSAGE_WARNING) << "value " << valueName << " in section [" << section << "] is " << value
			<< ", expected within " << min << " and " << max << sendLog;
}
