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

#ifndef __SKYCOND_TSKYAPP__
#define __SKYCOND_TSKYAPP__

#include "skycond/cliapp.h"

#include <iostream>
#include <vector>

#define OPT_CLEAR           (OPT_LOCAL + 1)
#define OPT_CLOUD           (OPT_LOCAL + 2)

// read when configuration is used and no --env-file is given
#define SKYCOND_DEFAULT_ENV_FILE   "config.env"

namespace skycond
{

/**
 * Compute corrected sky temperature from IR sensor and ambient temperature
 * readings and classify it. Result line is written to the output stream,
 * which is std::cout for the skycond-tsky program.
 *
 * @author Markus Wildi <markus.wildi@one-arcsec.org>
 */
class TSkyApp:public CliApp
{
	public:
		TSkyApp (int in_argc, char **in_argv, std::ostream &in_out = std::cout);

	protected:
		virtual int processOption (int in_opt);
		virtual int processArgs (const char *arg);

		virtual int init ();

		virtual void usage ();

		virtual int doProcessing ();

	private:
		std::ostream &out;

		const char *configFile;
		const char *envFile;
		bool useConfig;

		double clearLimit;
		double cloudLimit;
		bool clearSet;
		bool cloudSet;

		std::vector <double> readings;

		double parseNumber (const char *arg);
};

}

#endif							 /* !__SKYCOND_TSKYAPP__ */
