/* 
 * Command line application base.
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

#include "skycond/error.h"
#include "skycond/app.h"

#include "skycond-config.h"

#include <iostream>
#include <string>
#include <ctype.h>
#include <stdlib.h>

#define OPT_DEBUG        998

using namespace skycond;

static App *masterApp = NULL;

App *getMasterApp ()
{
	return masterApp;
}

LogStream logStream (messageType_t in_messageType)
{
	return LogStream (masterApp, in_messageType);
}

App::App (int argc, char **argv)
{
	app_argc = argc;
	app_argv = argv;

	debug = 0;

	addOption ('h', "help", 0, "print this help and exit");
	addOption (OPT_VERSION, "version", 0, "print version and exit");
	addOption (OPT_DEBUG, "debug", 0, "print debug messages");

	masterApp = this;
}

App::~App ()
{
	if (masterApp == this)
		masterApp = NULL;
}

bool App::isNegativeNumber (const char *arg)
{
	if (arg[0] != '-' || arg[1] == '\0')
		return false;
	char *endptr;
	strtod (arg, &endptr);
	return *endptr == '\0';
}

int App::parseCommandLine ()
{
	int ret;
	// stop at first argument, so "-20" is not taken for an option
	std::string shortOpts ("+");
	std::vector <struct option> longOpts;

	for (std::vector <Option>::iterator iter = options.begin (); iter != options.end (); iter++)
	{
		iter->appendShort (shortOpts);
		if (iter->haveLongOption ())
		{
			struct option lo;
			iter->fillLong (&lo);
			longOpts.push_back (lo);
		}
	}

	struct option last;
	last.name = NULL;
	last.has_arg = 0;
	last.flag = NULL;
	last.val = 0;
	longOpts.push_back (last);

	// 0 restarts getopt scanning
	optind = 0;

	while (true)
	{
		int next = optind > 0 ? optind : 1;
		if (next < app_argc && isNegativeNumber (app_argv[next]))
		{
			optind = next;
			break;
		}
		int c = getopt_long (app_argc, app_argv, shortOpts.c_str (), &(longOpts[0]), NULL);
		if (c == -1)
			break;
		// processOption reports its own errors
		ret = processOption (c);
		if (ret)
			return ret;
	}

	for (; optind < app_argc; optind++)
	{
		ret = processArgs (app_argv[optind]);
		if (ret)
		{
			logStream (MESSAGE_ERROR) << "cannot process argument " << app_argv[optind] << sendLog;
			return ret;
		}
	}

	return 0;
}

int App::init ()
{
	try
	{
		return parseCommandLine ();
	}
	catch (Error &er)
	{
		std::cerr << er << std::endl << std::endl << "Usage:" << std::endl;
		usage ();
		return -1;
	}
}

void App::usage ()
{
	std::cout << "  " << getAppName () << " [options]" << std::endl;
}

void App::help ()
{
	std::cout << "Usage:" << std::endl;
	usage ();
	std::cout << "Options:" << std::endl;
	for (std::vector <Option>::iterator iter = options.begin (); iter != options.end (); iter++)
		iter->help ();
}

int App::processOption (int in_opt)
{
	switch (in_opt)
	{
		case 'h':
			help ();
			exit (EXIT_SUCCESS);
		case OPT_DEBUG:
			debug++;
			break;
		case OPT_VERSION:
			std::cout << getAppName () << " from skycond " << SKYCOND_VERSION << std::endl
				<< "Configuration directory " << SKYCOND_CONFDIR << std::endl
				<< "Compiled with libnova"
#ifdef SKYCOND_LIBCHECK
				<< " libcheck"
#endif
				<< std::endl
				<< "This is free software, distributed under the GNU General Public License, version 2 or later." << std::endl
				<< "It comes with ABSOLUTELY NO WARRANTY." << std::endl;
			exit (EXIT_SUCCESS);
		case '?':
			std::cerr << "invalid option, run " << getAppName () << " --help for list of options" << std::endl;
			return -1;
		default:
			std::cerr << "unhandled option " << in_opt << std::endl;
			return -1;
	}
	return 0;
}

int App::processArgs (const char *arg)
{
	std::cerr << "unexpected argument " << arg << std::endl;
	return -1;
}

void App::addOption (int in_short_option, const char *in_long_option, int in_has_arg, const char *in_help_msg)
{
	options.push_back (Option (in_short_option, in_long_option, in_has_arg, in_help_msg));
}

void App::sendMessage (messageType_t in_messageType, const char *in_messageString)
{
	if (debug == 0 && in_messageType == MESSAGE_DEBUG)
		return;
	Message msg (getAppName (), in_messageType, in_messageString);
	std::cerr << msg << std::endl;
}

LogStream App::logStream (messageType_t in_messageType)
{
	return LogStream (this, in_messageType);
}
