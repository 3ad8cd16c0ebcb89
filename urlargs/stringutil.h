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
#ifndef STRINGUTIL_H
#define STRINGUTIL_H

#include <string>
#include <sstream>

#include "global.h"

//{{{ Stringutil ---------------------------------------------------------------

/**
 * String helper functions.
 */
class Stringutil {

    public:
        /**
         * Transforms a numeric value into a string.
         *
         * @param[in] number the number to transform
         * @return the string
         */
        template <typename numeric_type>
        static std::string number2string(numeric_type number);

        /**
         * Checks whether @p c is a hexadecimal digit (0-9, a-f, A-F).
         * Unlike isxdigit(3), this does not depend on the locale and is
         * defined for every value of a (possibly signed) char.
         */
        static bool isHexDigit(char c);

        /**
         * Value of a hexadecimal digit.
         *
         * @param[in] c the digit
         * @return value between 0 and 15
         * @exception UError if @p c is not a hex digit
         */
        static int hex2int(char c);

        /**
         * Percent-decode a string. See UString::decodePercent().
         *
         * @param[in] encoded the encoded string
         * @return the decoded bytes
         */
        static std::string percentDecode(const std::string &encoded);
};

//}}}
//{{{ UString implementation ---------------------------------------------------

/**
 * Enhancements of class std::string.
 */
class UString : public std::string {
    public:
        /**
         * Standard constructors (refer to std::string).
         */
        UString()
        : std::string()
        {}
        UString(const std::string& str)
        : std::string(str)
        {}
        UString(const std::string& str, size_type pos, size_type len = npos)
        : std::string(str, pos, len)
        {}
        UString(const char* s)
        : std::string(s)
        {}
        UString(const char* s, size_type n)
        : std::string(s, n)
        {}
        UString(size_type n, char c)
        : std::string(n, c)
        {}
        template <class InputIterator>
            UString(InputIterator first, InputIterator last)
        : std::string(first, last)
        {}

        /**
         * Perform percent decoding on the string.
         *
         * Every "%XX" where XX are two hex digits (any case) is replaced
         * by the byte with that value. Anything else, including a '%'
         * that is not followed by two hex digits, is kept as is; in that
         * case only the '%' itself is skipped, so "%%41" becomes "%A".
         * A '+' is never translated into a space. The string is scanned
         * only once, so "%2520" becomes "%20".
         *
         * @return reference to this object (after decoding)
         */
        UString &decodePercent();
};

//}}}
//{{{ Stringutil implementation ------------------------------------------------

// -----------------------------------------------------------------------------
template <typename numeric_type>
std::string Stringutil::number2string(numeric_type number)
{
    std::stringstream ss;
    ss << number;
    return ss.str();
}

//}}}
#endif /* STRINGUTIL_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
