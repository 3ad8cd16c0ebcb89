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
#include <cerrno>
#include <iostream>
#include <sstream>
#include <string>

#include "global.h"
#include "debug.h"
#include "linedecoder.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;
using std::istringstream;
using std::ostringstream;

// -----------------------------------------------------------------------------
static bool filters(const string &input, const string &expected,
                    unsigned long lines)
{
    istringstream in(input);
    ostringstream out;
    unsigned long n = LineDecoder::filter(in, out);
    if (out.str() != expected || n != lines) {
        cerr << "got " << n << " lines: '" << out.str() << "'" << endl;
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Stream failures that leave errno alone must not be reported as
// "(Success)".
static bool failsWith(istringstream &in, ostringstream &out,
                      const string &message)
{
    errno = 0;
    try {
        LineDecoder::filter(in, out);
    } catch (const UError &err) {
        if (err.what() == message)
            return true;
        cerr << "got '" << err.what() << "'" << endl;
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

        test.check("Empty input",
                   []() { return filters("", "", 0); });

        test.check("Two encoded lines",
                   []() {
                       return filters("line1%20one\nline2%20two\n",
                                      "line1 one\nline2 two\n", 2);
                   });

        test.check("Last line without line feed gets one",
                   []() { return filters("a%20b", "a b\n", 1); });

        test.check("Empty lines are kept",
                   []() { return filters("\n\nx\n", "\n\nx\n", 3); });

        test.check("Encoded line feed splits a line",
                   []() { return filters("x%0Ay\n", "x\ny\n", 1); });

        test.check("Carriage return is not a line terminator",
                   []() { return filters("a%20b\r\n", "a b\r\n", 1); });

        test.check("Escapes are not joined across lines",
                   []() { return filters("a%2\n0b\n", "a%2\n0b\n", 2); });

        test.check("Trailing percent sign on every line",
                   []() { return filters("1%\n2%\n", "1%\n2%\n", 2); });

        test.check("Plus sign is kept",
                   []() { return filters("a+b\n", "a+b\n", 1); });

        test.check("decodeAll returns the whole stream",
                   []() -> bool {
                       istringstream in("SELECT%20*%20FROM%20users\n"
                                        "%3B\n");
                       return LineDecoder::decodeAll(in) ==
                           "SELECT * FROM users\n;\n";
                   });

        test.check("Long line",
                   []() -> bool {
                       string encoded, decoded;
                       for (int i = 0; i < 10000; ++i) {
                           encoded += "ab%20";
                           decoded += "ab ";
                       }
                       return filters(encoded + "\n", decoded + "\n", 1);
                   });

        test.check("Failed output stream is reported",
                   []() -> bool {
                       istringstream in("x\n");
                       ostringstream out;
                       out.setstate(std::ios::badbit);
                       return failsWith(in, out, "Cannot write decoded line 1");
                   });

        test.check("Failed input stream is reported",
                   []() -> bool {
                       istringstream in("x\n");
                       ostringstream out;
                       in.setstate(std::ios::badbit);
                       return failsWith(in, out, "Cannot read encoded input");
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}
