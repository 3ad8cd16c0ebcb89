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
#ifndef LINEDECODER_H
#define LINEDECODER_H

#include <istream>
#include <ostream>
#include <string>

//{{{ LineDecoder --------------------------------------------------------------

/**
 * Percent-decodes a text stream line by line.
 *
 * A line ends with a line feed. The line feed is removed before the line
 * is decoded and written again afterwards, so an encoded "%0A" inside a
 * line produces an additional line in the output. A last line without a
 * line feed is decoded too and gets one appended.
 */
class LineDecoder {

    public:

        /**
         * Decode @p in and write the result to @p out.
         *
         * @param[in] in the encoded input
         * @param[out] out where the decoded lines go
         * @return number of lines
         * @exception USystemError if reading or writing fails
         */
        static unsigned long filter(std::istream &in, std::ostream &out);

        /**
         * Decode everything from @p in into memory.
         *
         * @param[in] in the encoded input
         * @return the decoded stream
         * @exception USystemError if reading fails
         */
        static std::string decodeAll(std::istream &in);
};

//}}}

#endif /* LINEDECODER_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
