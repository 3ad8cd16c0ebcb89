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
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include "process.h"
#include "global.h"
#include "stringutil.h"
#include "argv.h"
#include "debug.h"

using std::string;
using std::shared_ptr;
using std::initializer_list;

//{{{ SubProcess ---------------------------------------------------------------

// -----------------------------------------------------------------------------
SubProcess::SubProcess()
    : m_pid(-1)
{}

// -----------------------------------------------------------------------------
SubProcess::~SubProcess()
{
    if (m_pid != -1) {
        try {
            kill(SIGKILL);
            wait();
        } catch (const UError &err) {
            Debug::debug()->dbg("Cannot reap child %d: %s",
                                m_pid, err.what());
        }
    }
}

// -----------------------------------------------------------------------------
void SubProcess::checkSpawned(void)
{
    if (m_pid == -1)
        throw UError("SubProcess::checkSpawned(): no subprocess spawned");
}

// -----------------------------------------------------------------------------
void SubProcess::setChildFD(int fd, shared_ptr<SubProcessFD> setup)
{
    m_fdmap.erase(fd);
    if (setup)
        m_fdmap.emplace(fd, setup);
}

// -----------------------------------------------------------------------------
shared_ptr<SubProcessFD> SubProcess::getChildFD(int fd)
{
    auto it = m_fdmap.find(fd);
    return it != m_fdmap.end()
        ? it->second
        : shared_ptr<SubProcessFD>(nullptr);
}

// -----------------------------------------------------------------------------
void SubProcess::spawn(const string &name, const StringVector &args)
{
    Debug::debug()->trace("SubProcess::spawn(%s, %s)",
        name.c_str(), args.join(':').c_str());

    //
    // setup pipes
    //
    for (auto &elem : m_fdmap)
        elem.second->prepare();

    // the child must not write out our buffered output a second time
    std::cout.flush();
    fflush(NULL);

    //
    // execute the child
    //

    pid_t child = fork();
    if (child > 0) {            // parent code
        m_pid = child;

        for (auto &elem : m_fdmap)
            elem.second->finalizeParent();

    } else if (child == 0) {    // child code
        try {
            for (auto &elem : m_fdmap)
                elem.second->finalizeChild(elem.first);
            exec(name, args);
        } catch (const UExecError &err) {
            fprintf(stderr, PROGRAM_NAME ": %s\n", err.what());
            _exit(err.getExitStatus());
        } catch (const std::exception &err) {
            fprintf(stderr, PROGRAM_NAME ": %s\n", err.what());
            _exit(EXIT_CANNOT_EXECUTE);
        }

    } else {                    // parent code failure
        throw USystemError("SubProcess::spawn(): fork failed", errno);
    }

    Debug::debug()->dbg("Forked child PID %d", m_pid);
}

// -----------------------------------------------------------------------------
void SubProcess::exec(const string &name, const StringVector &args)
{
    Debug::debug()->trace("SubProcess::exec(%s, %s)",
        name.c_str(), args.join(':').c_str());

    std::cout.flush();
    fflush(NULL);

    ArgV fullV(name, args);
    execvp(name.c_str(), fullV.data());

    throw UExecError(name, errno);
}

// -----------------------------------------------------------------------------
void SubProcess::kill(int sig)
{
    Debug::debug()->trace("SubProcess::kill(%d)", sig);

    checkSpawned();

    if (::kill(m_pid, sig))
        throw USystemError("SubProcess::kill(): cannot send signal "
                           + Stringutil::number2string(sig), errno);
}

// -----------------------------------------------------------------------------
ExitStatus SubProcess::wait(void)
{
    Debug::debug()->trace("SubProcess::wait() on %d", m_pid);

    checkSpawned();

    int status;
    pid_t ret;
    do {
        ret = ::waitpid(m_pid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1)
        throw USystemError("SubProcess::wait(): cannot get state of PID "
                           + Stringutil::number2string(m_pid), errno);

    if (ret != m_pid)
        throw UError("SubProcess::wait(): spawned PID "
                     + Stringutil::number2string(m_pid) + " but PID "
                     + Stringutil::number2string(ret) + " exited.");

    Debug::debug()->dbg("PID %d exited with status 0x%04x", m_pid, status);

    m_pid = -1;
    return ExitStatus(status);
}

//}}}
//{{{ SubProcessFD -------------------------------------------------------------

// -----------------------------------------------------------------------------
SubProcessFD::~SubProcessFD()
{
}

// -----------------------------------------------------------------------------
void SubProcessFD::_move_fd(int& oldfd, int newfd)
{
    if (oldfd == newfd) {
        // already in place, but dup2() would keep O_CLOEXEC
        if (fcntl(newfd, F_SETFD, 0) < 0)
            throw USystemError("Cannot clear close-on-exec flag of fd "
                               + Stringutil::number2string(newfd), errno);
        oldfd = -1;
        return;
    }
    if (dup2(oldfd, newfd) < 0)
        throw USystemError("Cannot duplicate fd "
                           + Stringutil::number2string(oldfd)
                           + " to fd " + Stringutil::number2string(newfd),
                           errno);
    close(oldfd);
    oldfd = -1;
}

//}}}
//{{{ SubProcessPipe -----------------------------------------------------------

// -----------------------------------------------------------------------------
SubProcessPipe::~SubProcessPipe()
{
    close();
}

// -----------------------------------------------------------------------------
void SubProcessPipe::prepare()
{
    close();
    if (pipe2(m_pipefd, O_CLOEXEC) < 0)
        throw USystemError("Cannot create subprocess pipe", errno);
}

// -----------------------------------------------------------------------------
void SubProcessPipe::close()
{
    if (m_pipefd[0] >= 0)
        ::close(m_pipefd[0]);
    if (m_pipefd[1] >= 0)
        ::close(m_pipefd[1]);
    m_pipefd[0] = m_pipefd[1] = -1;
}

//}}}
//{{{ ParentToChildPipe --------------------------------------------------------

// -----------------------------------------------------------------------------
void ParentToChildPipe::finalizeParent()
{
    ::close(m_pipefd[0]);
    m_pipefd[0] = -1;
}

// -----------------------------------------------------------------------------
void ParentToChildPipe::finalizeChild(int fd)
{
    ::close(m_pipefd[1]);
    m_pipefd[1] = -1;
    _move_fd(m_pipefd[0], fd);
}

// -----------------------------------------------------------------------------
int ParentToChildPipe::parentFD()
{
    return m_pipefd[1];
}

// -----------------------------------------------------------------------------
size_t ParentToChildPipe::write(const char *data, size_t len)
{
    size_t done = 0;

    while (done < len) {
        ssize_t cnt = ::write(m_pipefd[1], data + done, len - done);
        if (cnt < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE) {
                Debug::debug()->dbg("Child closed its input after %lu bytes",
                                    (unsigned long)done);
                break;
            }
            throw USystemError("Cannot send data to input pipe", errno);
        }
        done += cnt;
    }

    return done;
}

//}}}
//{{{ ChildToParentPipe --------------------------------------------------------

// -----------------------------------------------------------------------------
void ChildToParentPipe::finalizeParent()
{
    ::close(m_pipefd[1]);
    m_pipefd[1] = -1;
}

// -----------------------------------------------------------------------------
void ChildToParentPipe::finalizeChild(int fd)
{
    ::close(m_pipefd[0]);
    m_pipefd[0] = -1;
    _move_fd(m_pipefd[1], fd);
}

// -----------------------------------------------------------------------------
int ChildToParentPipe::parentFD()
{
    return m_pipefd[0];
}

//}}}
//{{{ ExitStatus ---------------------------------------------------------------

// -----------------------------------------------------------------------------
bool ExitStatus::exited() const
{
    return WIFEXITED(m_status);
}

// -----------------------------------------------------------------------------
int ExitStatus::exitCode() const
{
    return WEXITSTATUS(m_status);
}

// -----------------------------------------------------------------------------
bool ExitStatus::signaled() const
{
    return WIFSIGNALED(m_status);
}

// -----------------------------------------------------------------------------
int ExitStatus::termSignal() const
{
    return WTERMSIG(m_status);
}

// -----------------------------------------------------------------------------
int ExitStatus::propagate() const
{
    if (exited())
        return exitCode();

    if (!signaled())
        return EXIT_FAILURE;

    int sig = termSignal();
    Debug::debug()->dbg("Child was killed by signal %d, raising it", sig);

    std::cout.flush();
    fflush(NULL);

    struct rlimit nocore;
    nocore.rlim_cur = nocore.rlim_max = 0;
    setrlimit(RLIMIT_CORE, &nocore);

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, sig);
    signal(sig, SIG_DFL);
    sigprocmask(SIG_UNBLOCK, &set, NULL);
    raise(sig);

    // the default action of this signal does not terminate
    return 128 + sig;
}

//}}}
//{{{ SignalGuard --------------------------------------------------------------

// -----------------------------------------------------------------------------
SignalGuard::SignalGuard(initializer_list<int> signals, void (*handler)(int))
{
    struct sigaction act;
    act.sa_handler = handler;
    act.sa_flags = 0;
    sigemptyset(&act.sa_mask);

    for (int sig : signals) {
        struct sigaction old;
        if (sigaction(sig, &act, &old) < 0) {
            int err = errno;
            restore();
            throw USystemError("Cannot set handler for signal "
                               + Stringutil::number2string(sig), err);
        }
        m_saved[sig] = old;
    }
}

// -----------------------------------------------------------------------------
SignalGuard::~SignalGuard()
{
    restore();
}

// -----------------------------------------------------------------------------
void SignalGuard::restore()
{
    for (auto &elem : m_saved)
        sigaction(elem.first, &elem.second, NULL);
    m_saved.clear();
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
