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
#include <cstdio>
#include <cstdarg>
#include <string>

#include <unistd.h>

#include "debug.h"

using std::string;

#define ANSI_COLOR_NORMAL   "\033[0m"
#define ANSI_COLOR_RED      "\033[31m"
#define ANSI_COLOR_GREEN    "\033[32m"
#define ANSI_COLOR_YELLOW   "\033[33m"

//{{{ Debug --------------------------------------------------------------------

Debug *Debug::m_instance = NULL;

// -----------------------------------------------------------------------------
Debug *Debug::debug()
{
    if (!m_instance)
        m_instance = new Debug();

    return m_instance;
}

// -----------------------------------------------------------------------------
Debug::Debug()
    : m_stderrLevel(DL_INFO), m_handle(NULL),
      m_useColor(isatty(STDERR_FILENO))
{}

// -----------------------------------------------------------------------------
void Debug::setStderrLevel(Debug::Level level)
{
    m_stderrLevel = level;
}

// -----------------------------------------------------------------------------
void Debug::setFileHandle(FILE *handle)
{
    m_handle = handle;
}

// -----------------------------------------------------------------------------
void Debug::trace(const char *msg, ...)
{
    va_list valist;

    va_start(valist, msg);
    vmsg(DL_TRACE, msg, valist);
    va_end(valist);
}

// -----------------------------------------------------------------------------
void Debug::dbg(const char *msg, ...)
{
    va_list valist;

    va_start(valist, msg);
    vmsg(DL_DEBUG, msg, valist);
    va_end(valist);
}

// -----------------------------------------------------------------------------
void Debug::info(const char *msg, ...)
{
    va_list valist;

    va_start(valist, msg);
    vmsg(DL_INFO, msg, valist);
    va_end(valist);
}

// -----------------------------------------------------------------------------
void Debug::vmsg(Debug::Level level, const char *msg, va_list args)
{
    bool toStderr = level >= m_stderrLevel;
    if (!toStderr && !m_handle)
        return;

    const char *name, *color;
    switch (level) {
        case DL_TRACE:
            name = "TRACE";
            color = ANSI_COLOR_GREEN;
            break;
        case DL_DEBUG:
            name = "DEBUG";
            color = ANSI_COLOR_YELLOW;
            break;
        default:
            name = "INFO";
            color = ANSI_COLOR_RED;
            break;
    }

    // a va_list can only be consumed once
    va_list fileargs;
    va_copy(fileargs, args);

    if (toStderr) {
        string format;
        if (m_useColor)
            format += color;
        format += string(name) + ": " + msg;
        if (m_useColor)
            format += ANSI_COLOR_NORMAL;
        format += '\n';

        vfprintf(stderr, format.c_str(), args);
        fflush(stderr);
    }

    if (m_handle) {
        fprintf(m_handle, "[%ld] %s: ", (long)getpid(), name);
        vfprintf(m_handle, (string(msg) + '\n').c_str(), fileargs);
        fflush(m_handle);
    }
    va_end(fileargs);
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
