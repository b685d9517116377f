/* 
 * Corrected sky temperature and cloud state from AAG raw readings.
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

#include "skycond/tskyapp.h"
#include "skycond/configuration.h"
#include "skycond/error.h"
#include "skycond/libnova_cpp.h"
#include "skycond/skytemp.h"
#include "skycond/utilsfunc.h"

#include <iomanip>
#include <stdlib.h>
#include <unistd.h>

using namespace skycond;

TSkyApp::TSkyApp (int in_argc, char **in_argv, std::ostream &in_out):CliApp (in_argc, in_argv), out (in_out)
{
	configFile = NULL;
	envFile = NULL;
	useConfig = false;

	clearLimit = SKYCOND_CLEAR_LIMIT;
	cloudLimit = SKYCOND_CLOUD_LIMIT;
	clearSet = false;
	cloudSet = false;

	addOption (OPT_CONFIG, "config", 1, "configuration file");
	addOption (OPT_ENV_FILE, "env-file", 1, "environment file with AAG_ overrides");
	addOption (OPT_ENVIRONMENT, "environment", 0, "use configuration defaults and environment, without configuration file");
	addOption (OPT_CLEAR, "clear", 1, "sky is clear below this temperature [deg C]");
	addOption (OPT_CLOUD, "cloud", 1, "sky is very cloudy above this temperature [deg C]");
}

double TSkyApp::parseNumber (const char *arg)
{
	char *endptr;
	double ret = strtod (arg, &endptr);
	if (*arg == '\0' || *endptr != '\0')
		throw ArgumentError (arg);
	return ret;
}

int TSkyApp::processOption (int in_opt)
{
	switch (in_opt)
	{
		case OPT_CONFIG:
			configFile = optarg;
			useConfig = true;
			break;
		case OPT_ENV_FILE:
			envFile = optarg;
			useConfig = true;
			break;
		case OPT_ENVIRONMENT:
			useConfig = true;
			break;
		case OPT_CLEAR:
			clearLimit = parseNumber (optarg);
			clearSet = true;
			break;
		case OPT_CLOUD:
			cloudLimit = parseNumber (optarg);
			cloudSet = true;
			break;
		default:
			return CliApp::processOption (in_opt);
	}
	return 0;
}

int TSkyApp::processArgs (const char *arg)
{
	readings.push_back (parseNumber (arg));
	return 0;
}

int TSkyApp::init ()
{
	int ret;

	ret = CliApp::init ();
	if (ret)
		return ret;

	if (!useConfig)
		return 0;

	Configuration *config = Configuration::instance ();

	if (envFile != NULL)
	{
		ret = config->loadEnvironmentFile (envFile);
		if (ret)
			return ret;
	}
	else if (access (SKYCOND_DEFAULT_ENV_FILE, R_OK) == 0)
	{
		ret = config->loadEnvironmentFile (SKYCOND_DEFAULT_ENV_FILE);
		if (ret)
			return ret;
	}

	if (configFile != NULL)
		ret = config->loadFile (configFile);
	else
		ret = config->loadEnvironment ();
	if (ret)
		return ret;

	if (config->getVerboseLogging () && getDebug () == 0)
		setDebug (1);

	CloudLimits limits = config->getCloudLimits ();
	if (!clearSet)
		clearLimit = limits.clear;
	if (!cloudSet)
		cloudLimit = limits.cloudy;

	return 0;
}

void TSkyApp::usage ()
{
	std::cout << "  " << getAppName () << " [options] <Ts> <Ta>" << std::endl
		<< "    Ts  raw sky temperature [deg C]" << std::endl
		<< "    Ta  ambient temperature [deg C]" << std::endl
		<< "  " << getAppName () << " -20.5 12" << std::endl
		<< "  " << getAppName () << " --config aag.ini -18 3.2" << std::endl;
}

int TSkyApp::doProcessing ()
{
	if (readings.size () != 2)
	{
		std::cerr << "expected two temperatures, got " << readings.size () << std::endl;
		usage ();
		return -1;
	}

	SkyCoefficients coefficients;
	units_t units = UNITS_METRIC;

	if (useConfig)
	{
		coefficients = Configuration::instance ()->getSkyCoefficients ();
		units = Configuration::instance ()->getUnits ();
		logStream (MESSAGE_DEBUG) << "observer " << Configuration::instance ()->getLocationName ()
			<< " at " << LibnovaPos (Configuration::instance ()->getObserver ())
			<< " " << Configuration::instance ()->getObservatoryAltitude () << " m" << sendLog;
	}

	logStream (MESSAGE_DEBUG) << "coefficients K1 " << coefficients.K1 << " K2 " << coefficients.K2
		<< " K3 " << coefficients.K3 << " K4 " << coefficients.K4 << " K5 " << coefficients.K5
		<< " K6 " << coefficients.K6 << " K7 " << coefficients.K7 << sendLog;
	logStream (MESSAGE_DEBUG) << "clear below " << clearLimit << " very cloudy above " << cloudLimit << sendLog;

	double ts = readings[0];
	double ta = readings[1];

	double tsky = skyTemperatureCorrected (ts, ta, coefficients);
	CloudState state = classifyCloudState (tsky, clearLimit, cloudLimit);

	logStream (MESSAGE_DEBUG) << "Ts " << ts << " Ta " << ta << " drift " << skyDrift (ta, coefficients) << sendLog;

	out << "T_sky: " << std::fixed << std::setprecision (2);
	switch (units)
	{
		case UNITS_IMPERIAL:
			out << celsiusToFahrenheit (tsky) << " °F";
			break;
		case UNITS_NONE:
			out << tsky;
			break;
		default:
			out << tsky << " °C";
			break;
	}
	out << " => " << cloudStateName (state) << std::endl;

	return 0;
}
