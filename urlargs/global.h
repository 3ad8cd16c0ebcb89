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
#ifndef GLOBAL_H
#define GLOBAL_H

#include <stdexcept>
#include <string>

#include "config.h"

//{{{ Constants ----------------------------------------------------------------

#define PROGRAM_NAME            "urlargs"
#define PROGRAM_VERSION_STRING  PROGRAM_NAME " " PACKAGE_VERSION

/**
 * Exit status for usage errors (bad options, missing executable).
 */
#define EXIT_USAGE              1

/**
 * Exit status when the executable cannot be run, or cannot be found.
 * Same values as a POSIX shell uses.
 */
#define EXIT_CANNOT_EXECUTE     126
#define EXIT_NOT_FOUND          127

//}}}
//{{{ UErrorCode ---------------------------------------------------------------

/**
 * Pure virtual class which serves as a base class for errors described
 * by integer code values.
 */
class UErrorCode {
    public:
        UErrorCode(int code)
            : m_code(code)
        {}

        virtual ~UErrorCode()
        {}

        virtual std::string message(void) const = 0;

        int getCode(void) const
        { return m_code; }

    private:
        int m_code;
};

//}}}
//{{{ UError -------------------------------------------------------------------

/**
 * Standard error class.
 */
class UError : public std::runtime_error {
    public:
        /**
         * Creates a new object of UError with string as error message.
         *
         * @param string the error message
         */
        UError(const std::string& string)
            : std::runtime_error(string) {}

};

//}}}
//{{{ UCodeError ---------------------------------------------------------------

/**
 * Standard error class template for errors that have a numeric code.
 */
template <class ErrorCode>
class UCodeError : public UError {
    public:
        /**
         * Creates a new object of UError with an error message format:
         *
         *   'message (ErrorCode(errorcode).message())'
         *
         * @param message the error message
         * @param errorcode the system error code (errno)
         */
        UCodeError(const std::string& message, int errorcode)
            : UError(message + " (" + ErrorCode(errorcode).message() + ")"),
              m_errorcode(errorcode)
        {}

        /**
         * Returns the numeric code the error was created with.
         */
        int getErrorCode() const
        { return m_errorcode; }

    private:
        int m_errorcode;
};

//}}}
//{{{ USystemErrorCode ---------------------------------------------------------

/**
 * Class for errors that store a value in the errno variable.
 */
class USystemErrorCode : public UErrorCode {
    public:
        USystemErrorCode(int code)
            : UErrorCode(code)
        {}

        virtual std::string message(void) const;
};

//}}}
//{{{ Pre-defined error classes ------------------------------------------------

typedef UCodeError<USystemErrorCode> USystemError;

//}}}
//{{{ UUsageError --------------------------------------------------------------

/**
 * Error in the way the program was called (unknown option, missing
 * executable). The main program prints a usage hint for these.
 */
class UUsageError : public UError {
    public:
        UUsageError(const std::string& string)
            : UError(string) {}
};

//}}}
//{{{ UExecError ---------------------------------------------------------------

/**
 * The target executable could not be started.
 */
class UExecError : public USystemError {
    public:
        /**
         * @param name the executable that failed
         * @param errorcode errno as set by execvp(3)
         */
        UExecError(const std::string& name, int errorcode)
            : USystemError("Execution of '" + name + "' failed", errorcode)
        {}

        /**
         * Returns the exit status a shell would use for this failure.
         */
        int getExitStatus() const;
};

//}}}

#endif /* GLOBAL_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
