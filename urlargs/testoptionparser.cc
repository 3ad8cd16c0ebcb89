/*
 * (c) 2025, The urlargs developers
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
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301, USA.
 */

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "global.h"
#include "argv.h"
#include "debug.h"
#include "invocation.h"
#include "option.h"
#include "optionparser.h"
#include "urlargs.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;
using std::ostringstream;

//{{{ ParseResult --------------------------------------------------------------

/**
 * Runs an OptionParser with a fixed set of options on a command line.
 */
class ParseResult {
    public:
        bool filter;
        bool dryRun;
        string logfile;
        StringVector args;
        bool logfileSet;

        ParseResult(const StringVector &cmdline)
            : filter(false), dryRun(false), logfileSet(false)
        {
            FlagOption filterOption("filter", 'f', &filter, "filter");
            FlagOption dryRunOption("dry-run", 'n', &dryRun, "dry run");
            FlagOption previewOption("preview", 'p', &dryRun, "preview");
            StringOption logfileOption("logfile", 'L', &logfile, "log");

            OptionParser parser;
            parser.addOption(&filterOption);
            parser.addOption(&dryRunOption);
            parser.addOption(&previewOption);
            parser.addOption(&logfileOption);

            ArgV argv("urlargs", cmdline);
            parser.parse(argv.size(), argv.data());
            args = parser.getArgs();
            logfileSet = logfileOption.isSet();
        }
};

//}}}

// -----------------------------------------------------------------------------
static bool usageError(const StringVector &cmdline, const string &needle)
{
    try {
        ParseResult r(cmdline);
    } catch (const UUsageError &e) {
        string msg(e.what());
        if (msg.find(needle) == string::npos) {
            cerr << "Unexpected message: " << msg << endl;
            return false;
        }
        return true;
    }
    return false;
}

// -----------------------------------------------------------------------------
static Invocation invocation(const StringVector &cmdline)
{
    UrlArgs ua;
    ArgV argv("urlargs", cmdline);
    ua.parseCommandline(argv.size(), argv.data());
    return ua.getInvocation();
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;

        // OptionParser
        test.check("No arguments at all",
                   []() -> bool {
                       ParseResult r(StringVector{});
                       return !r.filter && !r.dryRun && r.args.empty();
                   });

        test.check("Options before the executable are parsed",
                   []() -> bool {
                       ParseResult r({ "--filter", "--dry-run", "echo", "x" });
                       return r.filter && r.dryRun &&
                           r.args == StringVector({ "echo", "x" });
                   });

        test.check("Options after the executable belong to it",
                   []() -> bool {
                       ParseResult r({ "echo", "-n", "--filter", "a%20b" });
                       return !r.filter && !r.dryRun &&
                           r.args == StringVector({ "echo", "-n", "--filter",
                                                    "a%20b" });
                   });

        test.check("Preview is another name for dry run",
                   []() -> bool {
                       ParseResult r({ "--preview", "ls" });
                       return r.dryRun && r.args == StringVector({ "ls" });
                   });

        test.check("Short options can be grouped",
                   []() -> bool {
                       ParseResult r({ "-fn", "cat" });
                       return r.filter && r.dryRun;
                   });

        test.check("Double dash ends the options",
                   []() -> bool {
                       ParseResult r({ "--dry-run", "--", "--weird", "-x" });
                       return r.dryRun &&
                           r.args == StringVector({ "--weird", "-x" });
                   });

        test.check("String option with equals sign",
                   []() -> bool {
                       ParseResult r({ "--logfile=/tmp/log", "true" });
                       return r.logfileSet && r.logfile == "/tmp/log" &&
                           r.args == StringVector({ "true" });
                   });

        test.check("String option with separate argument",
                   []() -> bool {
                       ParseResult r({ "-L", "/tmp/log", "true" });
                       return r.logfileSet && r.logfile == "/tmp/log";
                   });

        test.check("Unknown long option",
                   []() { return usageError({ "--bogus", "echo" }, "--bogus"); });

        test.check("Unknown long option with value",
                   []() { return usageError({ "--bogus=1" }, "--bogus"); });

        test.check("Unknown short option",
                   []() { return usageError({ "-x", "echo" }, "-x"); });

        test.check("Missing option argument",
                   []() { return usageError({ "--logfile" }, "requires"); });

        test.check("Parser can run more than once",
                   []() -> bool {
                       ParseResult r1({ "-f", "cat" });
                       ParseResult r2({ "-n", "cat" });
                       return r1.filter && !r1.dryRun &&
                           !r2.filter && r2.dryRun;
                   });

        test.check("Help lists every option",
                   []() -> bool {
                       bool flag = false;
                       string value;
                       FlagOption a("dry-run", 'n', &flag, "Show only");
                       StringOption b("logfile", 'L', &value, "Log", "FILE");
                       OptionParser parser;
                       parser.addOption(&a);
                       parser.addOption(&b);
                       ostringstream ss;
                       parser.printHelp(ss);
                       string help = ss.str();
                       return help.find("--dry-run | -n") != string::npos &&
                           help.find("--logfile=FILE | -L FILE")
                               != string::npos;
                   });

        // UrlArgs::parseCommandline()
        test.check("Invocation of a plain command",
                   []() -> bool {
                       Invocation inv = invocation({ "echo", "hello%20world" });
                       return !inv.filterMode() && !inv.dryRun() &&
                           !inv.helpRequested() && inv.hasExecutable() &&
                           inv.executable() == "echo" &&
                           inv.encodedArgs() ==
                               StringVector({ "hello%20world" });
                   });

        test.check("Invocation in filter mode without executable",
                   []() -> bool {
                       Invocation inv = invocation({ "--filter" });
                       return inv.filterMode() && !inv.hasExecutable() &&
                           inv.encodedArgs().empty();
                   });

        test.check("Invocation with --preview and --dry-run",
                   []() -> bool {
                       Invocation a = invocation({ "--preview", "ls" });
                       Invocation b = invocation({ "--dry-run", "ls" });
                       return a.dryRun() && b.dryRun();
                   });

        test.check("Invocation with help and version",
                   []() -> bool {
                       Invocation inv = invocation({ "--help", "--version" });
                       return inv.helpRequested() && inv.versionRequested();
                   });

        test.check("Executable name is kept encoded",
                   []() -> bool {
                       Invocation inv = invocation({ "my%20prog" });
                       return inv.executable() == "my%20prog";
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}
