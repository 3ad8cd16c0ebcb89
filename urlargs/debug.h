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
#ifndef DEBUG_H
#define DEBUG_H

#include <cstdio>
#include <cstdarg>

//{{{ Debug --------------------------------------------------------------------

/**
 * Diagnostic output of urlargs.
 *
 * Messages at or above the stderr level are printed to stderr (coloured
 * if stderr is a terminal). If a log file is set, every message goes
 * there, prefixed with the PID of the writer, because a forked child
 * logs to the same file until it calls exec.
 */
class Debug {
    public:
        enum Level {
            DL_TRACE    = 0,
            DL_DEBUG    = 10,
            DL_INFO     = 20,
            DL_NONE     = 100
        };

    public:
        static Debug *debug();

        void trace(const char *msg, ...);
        void dbg(const char *msg, ...);

        /**
         * Messages at this level are shown without --debug, so use it
         * only for things the user has to know about.
         */
        void info(const char *msg, ...);

        void setStderrLevel(Debug::Level level);
        void setFileHandle(FILE *handle);

    protected:
        Debug();

    private:
        void vmsg(Debug::Level level, const char *msg, std::va_list args);

        static Debug *m_instance;

        Level m_stderrLevel;
        FILE *m_handle;
        bool m_useColor;
};

//}}}

#endif /* DEBUG_H */

// vim: set sw=4 ts=4 fdm=marker et:
