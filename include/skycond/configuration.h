/* 
 * Configuration file read routines.
 * Copyright (C) 2003-2010 Petr Kubanek <petr@kubanek.net>
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

/**
 * @file
 * Holds extension of IniParser class. This class is used to access
 * cloud sensor specific values from the configuration file and environment.
 */

#ifndef __SKYCOND_CONFIGURATION__
#define __SKYCOND_CONFIGURATION__

#include "skycond/iniparser.h"
#include "skycond/skytemp.h"

#include <libnova/libnova.h>

#define SKYCOND_ENV_PREFIX     "AAG_"
#define SKYCOND_TOP_SECTION    "weather"

namespace skycond
{

/**
 * Units used to report temperatures.
 */
typedef enum { UNITS_METRIC, UNITS_IMPERIAL, UNITS_NONE } units_t;

/**
 * Weather thresholds. Cloudy limits are in deg C, wind limits in km/h, wet
 * and rainy are raw rain sensor frequencies.
 */
struct Thresholds
{
	double cloudy;
	double veryCloudy;
	double windy;
	double veryWindy;
	double gusty;
	double veryGusty;
	int wet;
	int rainy;
};

/**
 * Rain sensor heater tunables. Those are only stored here, heater is driven
 * by sensor daemon.
 */
struct HeaterSettings
{
	// rain frequency wet trigger [Hz]
	double rainThresholdFreq;
	// PWM powers [%]
	double pwmMax;
	double pwmMid;
	double pwmLow;
	double hysteresis;

	// ambient temperature ranges [deg C]
	double lowTemp;
	double lowDelta;
	double highTemp;
	double highDelta;

	// impulse heating
	double impulseTemp;
	double impulseDuration;
	int impulseCycle;

	// PWM set on sensor connection [%]
	double minPower;
};

/**
 * Represent full Config class, which includes support for Libnova types and
 * holds cloud sensor values. The philosophy behind this class is to allow
 * quick access, without need to parse configuration file or to search for
 * configuration file string entries. Each value in configuration file is
 * mapped to apporpriate private member variable of this class, and public
 * access function is provided.
 *
 * Every value can be overriden from environment, see IniParser. Values from
 * [weather] section are mapped to AAG_VALUENAME, values from other sections
 * to AAG_SECTION__VALUENAME.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class Configuration:public IniParser
{
	public:
		Configuration (bool defaultSection = false);

		virtual ~ Configuration (void);

		/**
		 * Returns Configuration instance used by the application.
		 *
		 * @return Configuration instance.
		 */
		static Configuration *instance ();

		/**
		 * Fill values from environment and defaults, without
		 * reading any configuration file.
		 *
		 * @return -1 on error, 0 on success.
		 */
		int loadEnvironment ();

		const std::string getSerialPort () { return serialPort; }

		/**
		 * Delay before site is declared safe after unsafe condition [min].
		 */
		double getSafetyDelay () { return safetyDelay; }

		/**
		 * Delay between two readings of the sensor [s].
		 */
		double getCaptureDelay () { return captureDelay; }

		/**
		 * Number of readings averaged for single measurement.
		 */
		int getNumReadings () { return numReadings; }

		/**
		 * Sky quality reference value [mag/arcsec^2].
		 */
		double getSQReference () { return sqReference; }

		/**
		 * Returns names of the conditions (rain, cloud, gust, wind) which shall be ignored
		 * when safety is decided.
		 */
		const std::vector <std::string> & getIgnoreUnsafe () { return ignoreUnsafe; }

		bool ignoreUnsafeCondition (const char *condition);

		bool getVerboseLogging () { return verboseLogging; }

		double getSerialPortOpenDelay () { return serialPortOpenDelay; }

		const std::string getSoloDataFilePath () { return soloDataFilePath; }

		bool getHaveHeater () { return haveHeater; }

		units_t getUnits () { return units; }

		const Thresholds & getThresholds () { return thresholds; }

		/**
		 * Returns cloud states boundaries. Sky is clear below
		 * thresholds cloudy value, very cloudy above very_cloudy value.
		 */
		CloudLimits getCloudLimits () { return CloudLimits (thresholds.cloudy, thresholds.veryCloudy); }

		const HeaterSettings & getHeater () { return heater; }

		const std::string getLocationName () { return locationName; }

		/**
		 * Returns observer coordinates. Those are recorded in configuration file.
		 *
		 * @return ln_lnlat_posn structure, which contains observer coordinates.
		 */
		struct ln_lnlat_posn *getObserver () { return &observer; }

		/**
		 * Return observatory elevation above sea level [m].
		 */
		double getObservatoryAltitude () { return observatoryAltitude; }

		const std::string getTimezone () { return timeZone; }

		/**
		 * Returns coefficients of the sky temperature correction model.
		 */
		const SkyCoefficients & getSkyCoefficients () { return skyCoefficients; }

		/**
		 * Returns units name.
		 */
		static const char *getUnitsName (units_t u);

	protected:
		virtual int getSpecialValues ();

	private:
		static Configuration *pInstance;

		std::string serialPort;
		double safetyDelay;
		double captureDelay;
		int numReadings;
		double sqReference;
		std::vector <std::string> ignoreUnsafe;
		bool verboseLogging;
		double serialPortOpenDelay;
		std::string soloDataFilePath;
		bool haveHeater;
		units_t units;

		Thresholds thresholds;
		HeaterSettings heater;

		std::string locationName;
		struct ln_lnlat_posn observer;
		double observatoryAltitude;
		std::string timeZone;

		SkyCoefficients skyCoefficients;

		/**
		 * Read degrees value. Accepts decimal degrees as well as [+-]DD:MM:SS.
		 *
		 * @return -1 on error, 0 on success.
		 */
		int getDegrees (const char *section, const char *valueName, double &value, double defVal);

		/**
		 * Log warning if value lies outside of the given range.
		 */
		void checkRange (const char *section, const char *valueName, double value, double min, double max);
};

}
#endif							 /* !__SKYCOND_CONFIGURATION__ */
