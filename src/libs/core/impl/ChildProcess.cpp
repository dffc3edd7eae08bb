/*
 * Copyright (C) 2025 The vtrans authors
 *
 * This file is part of vtrans.
 *
 * vtrans is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * vtrans is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with vtrans.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <system_error>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "core/ILogger.hpp"

namespace vtrans::core
{
    namespace
    {
        class SystemException : public ChildProcessException
        {
        public:
            SystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            SystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        std::error_code lastError()
        {
            return std::error_code{ errno, std::generic_category() };
        }

        void closeFd(int& fd)
        {
            if (fd != -1)
            {
                ::close(fd);
                fd = -1;
            }
        }

        struct Pipe
        {
            int fds[2]{ -1, -1 };

            Pipe()
            {
                // Use 'pipe' instead of 'pipe2', more portable
                if (::pipe(fds) == -1)
                    throw SystemException{ lastError(), "pipe failed!" };

                // the child only keeps the ends it dup2ed
                for (const int fd : fds)
                {
                    if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
                    {
                        const std::error_code err{ lastError() };
                        closeAll();
                        throw SystemException{ err, "fcntl failed to set FD_CLOEXEC!" };
                    }
                }
            }
            ~Pipe() { closeAll(); }
            Pipe(const Pipe&) = delete;
            Pipe& operator=(const Pipe&) = delete;

            int& readEnd() { return fds[0]; }
            int& writeEnd() { return fds[1]; }

            int releaseReadEnd()
            {
                const int fd{ fds[0] };
                fds[0] = -1;
                return fd;
            }

            void closeAll()
            {
                closeFd(fds[0]);
                closeFd(fds[1]);
            }
        };

        void setNonBlocking(int fd)
        {
            const int flags{ ::fcntl(fd, F_GETFL) };
            if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
                throw SystemException{ lastError(), "fcntl failed to set O_NONBLOCK!" };
        }

        void growPipe([[maybe_unused]] int fd)
        {
#if defined(__linux__) && defined(F_SETPIPE_SZ)
            constexpr int targetPipeSize{ 65'536 * 4 };
            int currentPipeSize{ 65'536 }; // common default value
    #if defined(F_GETPIPE_SZ)
            const int pipeSizeRes{ ::fcntl(fd, F_GETPIPE_SZ) };
            if (pipeSizeRes == -1)
                VTRANS_LOG(CHILDPROCESS, DEBUG, "F_GETPIPE_SZ failed: " << lastError().message());
            else
                currentPipeSize = pipeSizeRes;
    #endif
            if (currentPipeSize < targetPipeSize)
            {
                if (::fcntl(fd, F_SETPIPE_SZ, targetPipeSize) == -1)
                    VTRANS_LOG(CHILDPROCESS, DEBUG, "F_SETPIPE_SZ failed: " << lastError().message());
            }
#endif
        }
    } // namespace

    ChildProcess::ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args)
        : _ioContext{ ioContext }
        , _childStdout{ _ioContext }
        , _childStderr{ _ioContext }
    {
        // make sure only one thread is executing this part of code
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        Pipe stdoutPipe;
        Pipe stderrPipe;
        Pipe execErrorPipe; // write end closed on successful exec, carries errno otherwise

        // Only set O_NONBLOCK on read ends - usually programs don't expect stdout to be non-blocking
        setNonBlocking(stdoutPipe.readEnd());
        setNonBlocking(stderrPipe.readEnd());
        growPipe(stdoutPipe.readEnd());

        // Everything the child needs is prepared before forking
        const std::string programPath{ path.string() };
        std::vector<const char*> execArgs;
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
        if (execArgs.empty())
            execArgs.push_back(programPath.c_str());
        execArgs.push_back(nullptr);

        const ::pid_t res{ ::fork() };
        if (res == -1)
            throw SystemException{ lastError(), "fork failed!" };

        if (res == 0) // CHILD
        {
            // Never close stdin/out/err, most programs expect these to exist;
            // rather connect them to /dev/null if unwanted
            const int nullFd{ ::open("/dev/null", O_RDWR) };
            if (nullFd != -1)
            {
                ::dup2(nullFd, STDIN_FILENO);
                ::close(nullFd);
            }

            if (::dup2(stdoutPipe.writeEnd(), STDOUT_FILENO) == -1
                || ::dup2(stderrPipe.writeEnd(), STDERR_FILENO) == -1)
            {
                const int err{ errno };
                [[maybe_unused]] const auto written{ ::write(execErrorPipe.writeEnd(), &err, sizeof(err)) };
                ::_exit(127);
            }

            // execvp looks up in PATH if the program has no directory component
            ::execvp(programPath.c_str(), const_cast<char* const*>(execArgs.data()));

            const int err{ errno };
            [[maybe_unused]] const auto written{ ::write(execErrorPipe.writeEnd(), &err, sizeof(err)) };
            ::_exit(127);
        }

        // PARENT
        _childPID = res;
        closeFd(stdoutPipe.writeEnd());
        closeFd(stderrPipe.writeEnd());
        closeFd(execErrorPipe.writeEnd());

        int execError{};
        ::ssize_t readRes;
        do
        {
            readRes = ::read(execErrorPipe.readEnd(), &execError, sizeof(execError));
        } while (readRes == -1 && errno == EINTR);

        if (readRes > 0)
        {
            {
                const std::scoped_lock exitLock{ _mutex };
                reap();
            }
            throw SystemException{ std::error_code{ execError, std::generic_category() }, "Cannot execute '" + programPath + "'" };
        }

        boost::system::error_code assignError;
        _childStdout.assign(stdoutPipe.releaseReadEnd(), assignError);
        if (!assignError)
            _childStderr.assign(stderrPipe.releaseReadEnd(), assignError);
        if (assignError)
        {
            kill();
            throw SystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
        }

        VTRANS_LOG(CHILDPROCESS, DEBUG, "Spawned child process " << _childPID << " ('" << programPath << "')");
    }

    ChildProcess::~ChildProcess()
    {
        VTRANS_LOG(CHILDPROCESS, DEBUG, "Closing child process " << _childPID << "...");
        for (FileDescriptor* descriptor : { &_childStdout, &_childStderr })
        {
            boost::system::error_code closeError;
            descriptor->close(closeError);
            if (closeError)
                VTRANS_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
        }

        kill();
    }

    void ChildProcess::kill()
    {
        const std::scoped_lock lock{ _mutex };

        if (_exitStatus)
            return;

        // process may already have finished
        VTRANS_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        if (::kill(_childPID, SIGKILL) == -1)
            VTRANS_LOG(CHILDPROCESS, DEBUG, "Kill failed: " << lastError().message());

        reap();
    }

    IChildProcess::ExitStatus ChildProcess::wait()
    {
        {
            const std::scoped_lock lock{ _mutex };
            if (_exitStatus)
                return *_exitStatus;
        }

        // Wait for the exit without reaping and without holding _mutex: kill() can still signal the pid
        // meanwhile, and the pid cannot be recycled as long as the zombie is not reaped
        ::siginfo_t info{};
        int res;
        do
        {
            res = ::waitid(P_PID, static_cast<::id_t>(_childPID), &info, WEXITED | WNOWAIT);
        } while (res == -1 && errno == EINTR);

        // ECHILD if kill() reaped it in the meantime
        if (res == -1 && errno != ECHILD)
            VTRANS_LOG(CHILDPROCESS, DEBUG, "waitid failed for process " << _childPID << ": " << lastError().message());

        const std::scoped_lock lock{ _mutex };
        if (!_exitStatus)
            reap();

        return *_exitStatus;
    }

    void ChildProcess::reap()
    {
        int wstatus{};
        ::pid_t pid;
        do
        {
            pid = ::waitpid(_childPID, &wstatus, 0);
        } while (pid == -1 && errno == EINTR);

        ExitStatus exitStatus;
        if (pid == -1)
        {
            VTRANS_LOG(CHILDPROCESS, ERROR, "waitpid failed for process " << _childPID << ": " << lastError().message());
        }
        else if (WIFEXITED(wstatus))
        {
            exitStatus.exitCode = WEXITSTATUS(wstatus);
            VTRANS_LOG(CHILDPROCESS, DEBUG, "Process " << _childPID << " exit code = " << *exitStatus.exitCode);
        }
        else if (WIFSIGNALED(wstatus))
        {
            exitStatus.termSignal = WTERMSIG(wstatus);
            VTRANS_LOG(CHILDPROCESS, DEBUG, "Process " << _childPID << " terminated by signal " << *exitStatus.termSignal);
        }

        _exitStatus = exitStatus;
    }

    ChildProcess::FileDescriptor& ChildProcess::getDescriptor(OutputStream stream)
    {
        return stream == OutputStream::Stdout ? _childStdout : _childStderr;
    }

    void ChildProcess::asyncRead(OutputStream stream, std::byte* data, std::size_t bufferSize, ReadCallback callback)
    {
        getDescriptor(stream).async_read_some(boost::asio::buffer(data, bufferSize),
            [callback{ std::move(callback) }](const boost::system::error_code& error, std::size_t bytesTransferred) {
                if (error)
                {
                    // forbidden to read any captured param here as the ChildProcess instance may already have been destroyed
                    if (error == boost::asio::error::operation_aborted)
                        return;

                    if (error == boost::asio::error::eof)
                    {
                        callback(ReadResult::EndOfFile, bytesTransferred);
                        return;
                    }

                    VTRANS_LOG(CHILDPROCESS, ERROR, "Read failed: " << error.message());
                    callback(ReadResult::Error, bytesTransferred);
                    return;
                }

                callback(ReadResult::Success, bytesTransferred);
            });
    }
} // namespace vtrans::core
