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
#include <cstdio>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "global.h"
#include "debug.h"
#include "dispatcher.h"
#include "invocation.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;
using std::ifstream;
using std::istringstream;
using std::ostringstream;
using std::stringstream;

//{{{ TempFile -----------------------------------------------------------------

/**
 * Temporary file that is removed again by the destructor.
 */
class TempFile {
    string m_name;

public:
    TempFile()
    {
        char name[] = "/tmp/testdispatcher.XXXXXX";
        int fd = mkstemp(name);
        if (fd < 0)
            throw USystemError("Cannot create temporary file", errno);
        close(fd);
        m_name = name;
    }

    ~TempFile()
    { unlink(m_name.c_str()); }

    const string &name() const
    { return m_name; }

    string contents() const
    {
        ifstream f(m_name.c_str());
        stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

//}}}

// -----------------------------------------------------------------------------
static Invocation plain(const StringVector &positional)
{
    return Invocation(false, false, false, false, positional);
}

// -----------------------------------------------------------------------------
static Invocation dryRun(const StringVector &positional, bool filter = false)
{
    return Invocation(false, false, true, filter, positional);
}

// -----------------------------------------------------------------------------
static Invocation filter(const StringVector &positional)
{
    return Invocation(false, false, false, true, positional);
}

// -----------------------------------------------------------------------------
static bool runs(const Invocation &inv, const string &input,
                 const string &expected, int status = EXIT_SUCCESS)
{
    istringstream in(input);
    ostringstream out;
    Dispatcher d(inv, in, out);
    int ret = d.run();
    if (ret != status || out.str() != expected) {
        cerr << "status " << ret << ", output '" << out.str() << "'" << endl;
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
static bool usageError(const Invocation &inv)
{
    istringstream in;
    ostringstream out;
    Dispatcher d(inv, in, out);
    try {
        d.run();
    } catch (const UUsageError &) {
        return out.str().empty();
    }
    return false;
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;

        test.check("Arguments are decoded once each",
                   []() -> bool {
                       Invocation inv = plain({ "echo", "a%20b", "%2520",
                                                "x+y", "%" });
                       istringstream in;
                       ostringstream out;
                       Dispatcher d(inv, in, out);
                       return d.decodeArguments() ==
                           StringVector({ "a b", "%20", "x+y", "%" });
                   });

        test.check("Missing executable is a usage error",
                   []() { return usageError(plain(StringVector())); });

        test.check("Missing executable in dry run is a usage error",
                   []() { return usageError(dryRun(StringVector())); });

        test.check("Empty executable is a usage error",
                   []() { return usageError(plain({ "" })); });

        test.check("Empty executable in filter mode is a usage error",
                   []() { return usageError(filter({ "", "x" })); });

        test.check("Dry run prints command and arguments",
                   []() {
                       return runs(dryRun({ "echo", "arg1%20space", "arg2" }),
                                   "",
                                   "Command: echo\n"
                                   "Arg 1: 'arg1 space'\n"
                                   "Arg 2: 'arg2'\n");
                   });

        test.check("Dry run without arguments",
                   []() {
                       return runs(dryRun({ "ls" }), "", "Command: ls\n");
                   });

        test.check("Dry run shows special characters literally",
                   []() {
                       return runs(dryRun({ "sh", "%27%22%3B%24%0A" }), "",
                                   "Command: sh\nArg 1: ''\";$\n'\n");
                   });

        test.check("Dry run does not decode the executable name",
                   []() {
                       return runs(dryRun({ "a%20b" }), "",
                                   "Command: a%20b\n");
                   });

        test.check("Dry run in filter mode leaves stdin alone",
                   []() -> bool {
                       istringstream in("a%20b\n");
                       ostringstream out;
                       Invocation inv = dryRun({ "cat", "%2D" }, true);
                       Dispatcher d(inv, in, out);
                       int ret = d.run();
                       string rest;
                       std::getline(in, rest);
                       return ret == EXIT_SUCCESS && rest == "a%20b" &&
                           out.str() == "Command: cat\nArg 1: '-'\n";
                   });

        test.check("Filter without executable prints decoded lines",
                   []() {
                       return runs(filter(StringVector()),
                                   "line1%20one\nline2%20two\n",
                                   "line1 one\nline2 two\n");
                   });

        test.check("Filter without executable ignores dry run",
                   []() {
                       return runs(dryRun(StringVector(), true),
                                   "x%3By\n", "x;y\n");
                   });

        test.check("Filter with executable feeds decoded input",
                   []() -> bool {
                       TempFile tmp;
                       Invocation inv = filter({ "sh", "-c",
                                                 "cat%20%3E%20%22$1%22",
                                                 "sh", tmp.name() });
                       bool ok = runs(inv,
                                      "SELECT%20*%20FROM%20users\nx%0Ay",
                                      "");
                       return ok && tmp.contents() ==
                           "SELECT * FROM users\nx\ny\n";
                   });

        test.check("Filter with executable returns its exit status",
                   []() {
                       return runs(filter({ "sh", "-c", "exit%203" }),
                                   "ignored\n", "", 3);
                   });

        test.check("Filter with a missing executable fails",
                   []() {
                       return runs(filter({ "/nonexistent/urlargs-test" }),
                                   "x\n", "", EXIT_NOT_FOUND);
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}
