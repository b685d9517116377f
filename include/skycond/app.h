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

#ifndef __SKYCOND_APP__
#define __SKYCOND_APP__

#include <vector>

#include "skycond/option.h"
#include "skycond/message.h"
#include "skycond/logstream.h"

namespace skycond
{

/**
 * Base of skycond programs. Holds table of the command line options,
 * parses them with getopt_long and passes the results to processOption and
 * processArgs. Log messages created by logStream end in sendMessage, which
 * prints them to stderr.
 *
 * The last constructed App becomes master application, returned by
 * getMasterApp (). Construct it on stack in main:
 *
 @code
 int main (int argc, char **argv)
 {
	MyApp app (argc, argv);
	return app.run ();
 }
 @endcode
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class App
{
	public:
		App (int argc, char **argv);
		virtual ~ App ();

		/**
		 * Execute the program. Descendants must call init ().
		 *
		 * @return program exit code
		 */
		virtual int run () = 0;

		/**
		 * Print message to stderr. Debug messages are dropped unless
		 * debugging was switched on.
		 */
		virtual void sendMessage (messageType_t in_messageType, const char *in_messageString);

		virtual LogStream logStream (messageType_t in_messageType);

		int getDebug () { return debug; }

		void setDebug (int d) { debug = d; }

	protected:
		/**
		 * Handle one option.
		 *
		 * @param in_opt  option code, as registered by addOption
		 *
		 * @return -1 on failure, 0 on success
		 */
		virtual int processOption (int in_opt);

		/**
		 * Handle positional argument. Called for every argument left
		 * after options. May throw skycond::Error.
		 *
		 * @return -1 on failure, 0 on success
		 */
		virtual int processArgs (const char *arg);

		/**
		 * Register option.
		 *
		 * @param in_short_option  option character, or code above 255 for long-only options
		 * @param in_long_option   long option name, NULL for none
		 * @param in_has_arg       0 no argument, 1 required argument, 2 optional argument
		 * @param in_help_msg      text printed by --help
		 */
		void addOption (int in_short_option, const char *in_long_option, int in_has_arg, const char *in_help_msg);

		const char *getAppName ()
		{
			return (app_argv != NULL && app_argv[0] != NULL) ? app_argv[0] : "skycond";
		}

		virtual void usage ();

		virtual void help ();

		/**
		 * Parse command line. Errors thrown while parsing are printed
		 * together with usage.
		 *
		 * @return -1 on error, 0 on success
		 */
		virtual int init ();

	private:
		std::vector < Option > options;

		int app_argc;
		char **app_argv;

		int debug;

		int parseCommandLine ();

		// arguments that parse as numbers ("-20", "-inf") are not options
		bool isNegativeNumber (const char *arg);
};

}

/**
 * Returns master application, NULL if no App exists.
 */
skycond::App *getMasterApp ();

/**
 * Create log stream. Messages are delivered to master application,
 * or printed to stderr if there is none.
 *
 @code
 logStream (MESSAGE_WARNING) << "value " << val << " out of range" << sendLog;
 @endcode
 */
skycond::LogStream logStream (messageType_t in_messageType);

#endif							 /* !__SKYCOND_APP__ */
