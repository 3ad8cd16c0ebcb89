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

#include "global.h"
#include "stringutil.h"

using std::string;

//{{{ Stringutil ---------------------------------------------------------------

// -----------------------------------------------------------------------------
bool Stringutil::isHexDigit(char c)
{
    return (c >= '0' && c <= '9') ||
        (c >= 'a' && c <= 'f') ||
        (c >= 'A' && c <= 'F');
}

// -----------------------------------------------------------------------------
int Stringutil::hex2int(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    throw UError(string("Stringutil::hex2int: '") + c + "' is not a hex digit");
}

// -----------------------------------------------------------------------------
string Stringutil::percentDecode(const string &encoded)
{
    UString ret(encoded);
    return ret.decodePercent();
}

//}}}
//{{{ UString ------------------------------------------------------------------

// -----------------------------------------------------------------------------
UString &UString::decodePercent()
{
    iterator src, dst;
    for (src = dst = begin(); src != end(); ++src) {
        if (*src == '%' && end() - src > 2 &&
            Stringutil::isHexDigit(src[1]) && Stringutil::isHexDigit(src[2])) {
            *dst++ = static_cast<char>((Stringutil::hex2int(src[1]) << 4) |
                                       Stringutil::hex2int(src[2]));
            src += 2;
        } else
            *dst++ = *src;
    }
    resize(dst - begin());
    return *this;
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
