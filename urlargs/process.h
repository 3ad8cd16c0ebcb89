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
#ifndef PROCESS_H
#define PROCESS_H

#include <map>
#include <memory>
#include <string>
#include <initializer_list>

#include <signal.h>
#include <sys/types.h>

#include "global.h"
#include "stringvector.h"

//{{{ SubProcessFD -------------------------------------------------------------

/**
 * Abstract base class for file descriptor setup.
 */
class SubProcessFD {

    public:

        virtual ~SubProcessFD();

        /**
         * Do all necessary preparations before forking.
         */
        virtual void prepare() = 0;

        /**
         * Finalize the file descriptor in parent.
         */
        virtual void finalizeParent() = 0;

        /**
         * Finalize the file descriptor in child.
         *
         * @param[in] fd file descriptor in child
         */
        virtual void finalizeChild(int fd) = 0;

        /**
         * Get the file descriptor used by the parent, or -1 if the
         * parent does not keep one.
         */
        virtual int parentFD() = 0;

    protected:

        void _move_fd(int& oldfd, int newfd);
};

//}}}
//{{{ SubProcessPipe -----------------------------------------------------------

class SubProcessPipe : public SubProcessFD {

    protected:

        int m_pipefd[2];

    public:

        SubProcessPipe()
        { m_pipefd[0] = m_pipefd[1] = -1; }

        ~SubProcessPipe();
        void prepare();

        /**
         * Explicitly close the pipe.
         */
        void close();
};

//}}}
//{{{ ParentToChildPipe --------------------------------------------------------

/**
 * Pipe for data written from parent to child.
 */
class ParentToChildPipe : public SubProcessPipe {

    public:

        void finalizeParent();
        void finalizeChild(int fd);
        int parentFD();

        /**
         * Write a buffer to the child, retrying short writes.
         *
         * If the child closes its end before all data has been written,
         * the rest is dropped silently; that is the same thing that
         * happens when a program stops reading its terminal. SIGPIPE
         * must be ignored by the caller for this to work.
         *
         * @param[in] data the bytes to write
         * @param[in] len number of bytes
         * @return number of bytes the child accepted
         * @exception USystemError on any other write error
         */
        size_t write(const char *data, size_t len);
};

//}}}
//{{{ ChildToParentPipe --------------------------------------------------------

/**
 * Pipe for data written from child to parent.
 */
class ChildToParentPipe : public SubProcessPipe {

    public:

        void finalizeParent();
        void finalizeChild(int fd);
        int parentFD();
};

//}}}
//{{{ ExitStatus ---------------------------------------------------------------

/**
 * Child termination status as returned by waitpid(2).
 */
class ExitStatus {

    public:

        explicit ExitStatus(int status)
            : m_status(status)
        { }

        bool exited() const;
        int exitCode() const;
        bool signaled() const;
        int termSignal() const;

        /**
         * Make the calling process terminate the way the child did.
         *
         * If the child was killed by a signal, the default action for
         * that signal is restored and the signal is raised, so this
         * function does not return in that case. Core dumps are disabled
         * first, because the child already wrote one if it was going to.
         *
         * @return the exit code to be passed to exit(3)
         */
        int propagate() const;

    private:
        int m_status;
};

//}}}
//{{{ SignalGuard --------------------------------------------------------------

/**
 * Sets the disposition of some signals and restores the previous ones
 * when the object goes out of scope.
 */
class SignalGuard {

    public:

        /**
         * @param[in] signals the signals to change
         * @param[in] handler new handler, SIG_IGN by default
         * @exception USystemError if sigaction(2) fails
         */
        SignalGuard(std::initializer_list<int> signals,
                    void (*handler)(int) = SIG_IGN);
        ~SignalGuard();

    private:
        SignalGuard(const SignalGuard &);
        SignalGuard &operator=(const SignalGuard &);
        void restore();

        std::map<int, struct sigaction> m_saved;
};

//}}}
//{{{ SubProcess ---------------------------------------------------------------

/**
 * Representation of a subprocess in the parent.
 */
class SubProcess {

    public:

        /**
         * Prepare a new subprocess.
         */
        SubProcess();

        /**
         * Destructor. Kills (SIGKILL) and reaps the subprocess if it is
         * still running.
         */
        virtual ~SubProcess();

        /**
         * Set up a file descriptor in the child.
         *
         * @param[in] fd file descriptor in the child
         * @param[in] setup file descriptor setup class, or nullptr to
         *            let the child inherit the descriptor
         */
        void setChildFD(int fd, std::shared_ptr<SubProcessFD> setup);

        /**
         * Get child file descriptor setup.
         *
         * @param[in] fd file descriptor in the child
         * @return the setup class, or nullptr if the descriptor is
         *         inherited
         */
        std::shared_ptr<SubProcessFD> getChildFD(int fd);

        /**
         * Spawns a subprocess.
         *
         * If the executable cannot be run, the child prints the reason to
         * stderr and exits with status 127 (not found) or 126 (any other
         * failure), like a shell does.
         *
         * @param[in] name the executable (PATH is searched) of the process
         *            to execute
         * @param[in] args the arguments for the process (argv[0] is used from
         *            @c name, so it cannot be overwritten here). Pass an empty
         *            list if you don't want to provide arguments.
         * @exception USystemError if fork(2) or the pipe setup fails
         */
        void spawn(const std::string &name, const StringVector &args);

        /**
         * Replace the current process image.
         *
         * Standard output is flushed first, everything else is inherited
         * as is.
         *
         * @param[in] name the executable (PATH is searched)
         * @param[in] args the arguments (without argv[0])
         * @exception UExecError if execvp(3) fails; the function never
         *            returns otherwise
         */
        static void exec(const std::string &name, const StringVector &args);

        /**
         * Get the child process ID.
         *
         * @returns system PID, or -1 if none.
         */
        pid_t getChildPID(void) const
        { return m_pid; }

        /**
         * Send a signal to the child process.
         *
         * @param[in] sig The signal to be sent, see kill(2).
         * @exception USystemError if kill(2) fails.
         */
        void kill(int sig);

        /**
         * Wait for the child to terminate.
         *
         * @return Child exit status, see wait(2).
         */
        ExitStatus wait(void);

    protected:

        /**
         * Make sure that a child process has been spawned.
         *
         * @exception UError if there is no child process.
         */
        void checkSpawned(void);

        pid_t m_pid;

    private:

        std::map<int, std::shared_ptr<SubProcessFD>> m_fdmap;
};

//}}}

#endif /* PROCESS_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
