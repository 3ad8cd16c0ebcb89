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
#include <string>
#include <sstream>
#include <cerrno>

#include "global.h"
#include "debug.h"
#include "stringutil.h"
#include "linedecoder.h"

using std::string;
using std::istream;
using std::ostream;
using std::ostringstream;
using std::getline;

//{{{ LineDecoder --------------------------------------------------------------

// -----------------------------------------------------------------------------
// A stream can fail without a failing system call, errno is 0 then.
static void streamError(const string &message)
{
    if (errno == 0)
        throw UError(message);
    throw USystemError(message, errno);
}

// -----------------------------------------------------------------------------
unsigned long LineDecoder::filter(istream &in, ostream &out)
{
    Debug::debug()->trace("LineDecoder::filter()");

    unsigned long lines = 0;
    UString line;

    errno = 0;
    while (getline(in, line)) {
        out << line.decodePercent() << '\n';
        if (!out)
            streamError("Cannot write decoded line "
                        + Stringutil::number2string(lines + 1));
        ++lines;
    }
    if (in.bad())
        streamError("Cannot read encoded input");

    out.flush();
    if (!out)
        streamError("Cannot write decoded output");

    Debug::debug()->dbg("Decoded %lu lines", lines);
    return lines;
}

// -----------------------------------------------------------------------------
string LineDecoder::decodeAll(istream &in)
{
    ostringstream ss;
    filter(in, ss);
    return ss.str();
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
