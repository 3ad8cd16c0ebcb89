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
#include <iostream>
#include <cstdlib>
#include <cstdio>
#include <string>
#include <sstream>
#include <cstring>
#include <cerrno>

#include "urlargs.h"
#include "config.h"
#include "debug.h"
#include "dispatcher.h"
#include "option.h"
#include "optionparser.h"

using std::cin;
using std::cout;
using std::endl;
using std::string;
using std::ostream;
using std::ostringstream;
using std::fopen;
using std::fclose;
using std::strerror;

//{{{ UrlArgs ------------------------------------------------------------------

// -----------------------------------------------------------------------------
static void close_file(int error, void *arg)
{
    (void)error;
    fclose((FILE *)arg);
}

// -----------------------------------------------------------------------------
UrlArgs::UrlArgs()
{}

// -----------------------------------------------------------------------------
UrlArgs::~UrlArgs()
{
    Debug::debug()->trace("UrlArgs::~UrlArgs()");
}

// -----------------------------------------------------------------------------
void UrlArgs::parseCommandline(int argc, char *argv[])
{
    bool doHelp = false, doVersion = false;
    bool dryRun = false, filter = false;
    bool debugEnabled = false;
    string logFilename;

    FlagOption helpOption(
        "help", 'h', &doHelp,
        "Print this help and exit");
    FlagOption versionOption(
        "version", 'v', &doVersion,
        "Print version information and exit");
    FlagOption dryRunOption(
        "dry-run", 'n', &dryRun,
        "Show the decoded command and arguments instead of running them");
    FlagOption previewOption(
        "preview", 'p', &dryRun,
        "Same as --dry-run");
    FlagOption filterOption(
        "filter", 'f', &filter,
        "Also decode standard input, line by line");
    FlagOption debugOption(
        "debug", 'D', &debugEnabled,
        "Print debugging output");
    StringOption logFileOption(
        "logfile", 'L', &logFilename,
        "Use the specified logfile for debugging output", "FILE");

    OptionParser optionParser;
    optionParser.addOption(&helpOption);
    optionParser.addOption(&versionOption);
    optionParser.addOption(&dryRunOption);
    optionParser.addOption(&previewOption);
    optionParser.addOption(&filterOption);
    optionParser.addOption(&debugOption);
    optionParser.addOption(&logFileOption);

    // the options only live until the end of this method
    ostringstream help;
    optionParser.printHelp(help, "   ");
    m_optionHelp = help.str();

    optionParser.parse(argc, argv);

    // debug messages
    if (logFileOption.isSet() && debugEnabled) {
        // "e": the executed program must not inherit the log file
        FILE *fp = fopen(logFilename.c_str(), "ae");
        if (fp) {
            Debug::debug()->setFileHandle(fp);
            on_exit(close_file, fp);
        } else
            Debug::debug()->info("Cannot open log file %s: %s",
                                 logFilename.c_str(), strerror(errno));
        Debug::debug()->dbg("STARTUP ----------------------------------");
    } else if (debugEnabled)
        Debug::debug()->setStderrLevel(Debug::DL_TRACE);

    m_invocation.reset(new Invocation(doHelp, doVersion, dryRun, filter,
                                      optionParser.getArgs()));
}

// -----------------------------------------------------------------------------
const Invocation &UrlArgs::getInvocation() const
{
    if (!m_invocation)
        throw UError("UrlArgs::getInvocation(): command line not parsed");
    return *m_invocation;
}

// -----------------------------------------------------------------------------
int UrlArgs::execute()
{
    const Invocation &invocation = getInvocation();

    if (invocation.helpRequested()) {
        printHelp(cout);
        return EXIT_SUCCESS;
    } else if (invocation.versionRequested()) {
        printVersion(cout);
        return EXIT_SUCCESS;
    }

    Dispatcher dispatcher(invocation, cin, cout);
    return dispatcher.run();
}

// -----------------------------------------------------------------------------
void UrlArgs::printUsage(ostream &os)
{
    os << "Usage: " PROGRAM_NAME " [OPTIONS] [--] EXECUTABLE [ARGUMENTS...]"
       << endl;
    os << "       " PROGRAM_NAME " --filter [OPTIONS] [EXECUTABLE [ARGUMENTS...]]"
       << endl;
}

// -----------------------------------------------------------------------------
void UrlArgs::printHelp(ostream &os)
{
    os << PROGRAM_VERSION_STRING " - run commands with URL-decoded arguments"
       << endl << endl;
    printUsage(os);
    os << endl;
    os << "Every argument after EXECUTABLE is percent-decoded (%XX becomes the"
       << endl
       << "byte with hex value XX) before EXECUTABLE is run, so arguments with"
       << endl
       << "spaces, quotes, semicolons, newlines or other characters that are"
       << endl
       << "special to a shell can be passed without any shell quoting. The"
       << endl
       << "executable name itself is not decoded." << endl << endl;
    os << "In filter mode, standard input is decoded line by line, too. Without"
       << endl
       << "EXECUTABLE the decoded lines are printed, otherwise they become the"
       << endl
       << "standard input of EXECUTABLE." << endl << endl;

    os << "Options" << endl << endl;
    os << m_optionHelp;
    os << "--" << endl
       << "     End of options (for an executable whose name begins with --)"
       << endl << endl;

    os << "Encoding rules" << endl << endl
       << "   - Always use %20 for a space. A '+' is passed through unchanged."
       << endl
       << "   - Encode %, quotes (%22, %27), ; (%3B), * (%2A), ? (%3F), $ (%24),"
       << endl
       << "     | (%7C), & (%26), < (%3C), > (%3E), ( ) (%28 %29), [ ] (%5B %5D),"
       << endl
       << "     \\ (%5C), ` (%60), ! (%21), newline (%0A), carriage return (%0D)."
       << endl
       << "   - A % that is not followed by two hex digits stays as it is."
       << endl
       << "   - Decoding is done exactly once: %2520 becomes %20." << endl
       << "   - %00 decodes to a NUL byte, which ends an argument of"
       << endl
       << "     EXECUTABLE. It is passed through in --filter input." << endl
       << "   - Put encoded arguments in double quotes." << endl << endl;

    os << "Examples" << endl << endl
       << "   " PROGRAM_NAME " sqlite3 my.db \"SELECT%20*%20FROM%20users\"" << endl
       << "   " PROGRAM_NAME " --dry-run grep \"search%20term\" file.txt" << endl
       << "   echo \"SELECT%20*%20FROM%20users\" | " PROGRAM_NAME " --filter" << endl
       << "   echo \"SELECT%20*%20FROM%20users\" | " PROGRAM_NAME
          " --filter sqlite3 my.db" << endl
       << "   " PROGRAM_NAME " find . -name \"a%20b\" -exec grep x {} \"%3B\"" << endl;
}

// -----------------------------------------------------------------------------
void UrlArgs::printVersion(ostream &os)
{
    os << PROGRAM_VERSION_STRING << endl;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
