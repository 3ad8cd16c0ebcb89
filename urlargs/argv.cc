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
#include <cstring>

#include "argv.h"
#include "debug.h"

using std::string;

//{{{ ArgV ---------------------------------------------------------------------

//------------------------------------------------------------------------------
ArgV::ArgV(const string &name, const StringVector &args)
    : StringVector()
{
    reserve(args.size() + 1);
    push_back(name);
    insert(end(), args.begin(), args.end());

    // %00 decodes fine, but a C string argument ends at the first NUL
    for (size_type i = 1; i < size(); ++i) {
        string::size_type nul = at(i).find('\0');
        if (nul != string::npos)
            Debug::debug()->info("Argument %lu contains a NUL byte, "
                                 "the program only gets the first %lu bytes",
                                 (unsigned long)i, (unsigned long)nul);
    }
}

//------------------------------------------------------------------------------
char **ArgV::data()
{
    // copy string data, each C string ends at its first NUL
    m_unique.clear();
    m_unique.reserve(size());
    for (auto const& it : *this) {
        unique_ptr ptr(new char[it.length() + 1]);
        std::memcpy(ptr.get(), it.c_str(), it.length() + 1);
        m_unique.push_back(std::move(ptr));
    }

    // update the pointer array
    m_array.clear();
    m_array.reserve(size() + 1);
    for (auto const& it : m_unique)
        m_array.push_back(it.get());
    m_array.push_back(nullptr);

    return m_array.data();
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
