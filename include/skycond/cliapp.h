/* 
 * Single run command line program.
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

#ifndef __SKYCOND_CLIAPP__
#define __SKYCOND_CLIAPP__

#include "skycond/app.h"

namespace skycond
{

/**
 * Program which parses its command line, does its work once and exits.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class CliApp:public App
{
	public:
		CliApp (int in_argc, char **in_argv);

		/**
		 * Calls init (), doProcessing () and afterProcessing ().
		 *
		 * @return doProcessing () result, or init () error
		 */
		virtual int run ();

	protected:
		virtual int doProcessing () = 0;

		/**
		 * Called after doProcessing (), even when it failed.
		 */
		virtual void afterProcessing () {}
};

}

#endif							 /* !__SKYCOND_CLIAPP__ */
