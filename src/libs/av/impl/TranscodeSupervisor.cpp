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


#include "TranscodeSupervisor.hpp"

#include <cassert>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "EncoderArguments.hpp"
#include "MetadataParser.hpp"
#include "ProcessOutputReader.hpp"
#include "ProgressParser.hpp"

namespace vtrans::av
{
#define JOB_LOG(job, severity, message) VTRANS_LOG(TRANSCODING, severity, "[" << (job).id << "] - " << message)

    namespace
    {
        constexpr std::size_t maxKeptErrorLines{ 10 };

        void keepErrorLine(std::vector<std::string>& errorLines, std::string_view line)
        {
            if (errorLines.size() == maxKeptErrorLines)
                errorLines.erase(std::begin(errorLines));

            errorLines.emplace_back(line);
        }

        std::string describeFailure(std::string_view programName, const core::IChildProcess::ExitStatus& exitStatus, const std::vector<std::string>& errorLines)
        {
            std::string res{ programName };

            if (exitStatus.exitCode)
                res += " exited with code " + std::to_string(*exitStatus.exitCode);
            else if (exitStatus.termSignal)
                res += " was killed by signal " + std::to_string(*exitStatus.termSignal);
            else
                res += " ended abnormally";

            if (!errorLines.empty())
                res += ": " + core::stringUtils::joinStrings(errorLines, " | ");

            return res;
        }

        struct Probe
        {
            std::promise<MediaMetadata> promise;
            std::string output;
            std::vector<std::string> errorLines;
        };

        void onProbeOutputLine(Probe& probe, core::IChildProcess::OutputStream stream, std::string_view line)
        {
            if (stream == core::IChildProcess::OutputStream::Stdout)
            {
                probe.output += line;
                probe.output += '\n';
            }
            else
            {
                VTRANS_LOG(PROBE, DEBUG, "Prober error output: " << line);
                keepErrorLine(probe.errorLines, line);
            }
        }

        void onProbeExit(Probe& probe, const core::IChildProcess::ExitStatus& exitStatus)
        {
            if (!exitStatus.succeeded())
            {
                const ProbeException error{ describeFailure("Prober", exitStatus, probe.errorLines) };
                VTRANS_LOG(PROBE, ERROR, error.what());
                probe.promise.set_exception(std::make_exception_ptr(error));
                return;
            }

            try
            {
                probe.promise.set_value(parseMediaMetadata(probe.output));
            }
            catch (const ProbeException& error)
            {
                VTRANS_LOG(PROBE, ERROR, error.what());
                probe.promise.set_exception(std::make_exception_ptr(error));
            }
        }
    } // namespace

    const char* getTranscodeStatusName(TranscodeStatus status)
    {
        switch (status)
        {
        case TranscodeStatus::Idle:
            return "idle";
        case TranscodeStatus::Running:
            return "running";
        case TranscodeStatus::Ended:
            return "ended";
        case TranscodeStatus::Error:
            return "error";
        }
        return "";
    }

    struct TranscodeSupervisor::Job
    {
        Job(std::size_t jobId, const TranscodeOptions& jobOptions)
            : id{ jobId }
            , options{ jobOptions }
        {
        }

        const std::size_t id;
        const TranscodeOptions options;
        std::promise<void> promise; // settled by whoever removes the job from the slot
        std::weak_ptr<ProcessOutputReader> reader;
        ProgressParser progressParser;       // stdout handlers only
        std::vector<std::string> errorLines; // stderr handlers only
    };

    struct TranscodeSupervisor::JobSlot
    {
        std::mutex mutex;
        TranscodeStatus status{ TranscodeStatus::Idle };
        std::shared_ptr<Job> currentJob; // set only while Running
        std::size_t nextJobId{};
    };

    std::unique_ptr<ITranscodeSupervisor> createTranscodeSupervisor(core::IChildProcessManager& childProcessManager, const ExecutablePaths& executablePaths)
    {
        return std::make_unique<TranscodeSupervisor>(childProcessManager, executablePaths);
    }

    TranscodeSupervisor::TranscodeSupervisor(core::IChildProcessManager& childProcessManager, const ExecutablePaths& executablePaths)
        : _childProcessManager{ childProcessManager }
        , _executablePaths{ executablePaths }
        , _slot{ std::make_shared<JobSlot>() }
    {
        VTRANS_LOG(TRANSCODING, DEBUG, "Using encoder " << _executablePaths.encoder << " and prober " << _executablePaths.prober);
    }

    TranscodeSupervisor::~TranscodeSupervisor()
    {
        cancelCurrentJob();
    }

    std::shared_ptr<TranscodeSupervisor::Job> TranscodeSupervisor::transition(JobSlot& slot, TranscodeStatus status, std::shared_ptr<Job> job)
    {
        assert((status == TranscodeStatus::Running) == static_cast<bool>(job));

        VTRANS_LOG(TRANSCODING, DEBUG, "Status " << getTranscodeStatusName(slot.status) << " -> " << getTranscodeStatusName(status));
        slot.status = status;
        return std::exchange(slot.currentJob, std::move(job));
    }

    void TranscodeSupervisor::killJobProcess(Job& job)
    {
        // no reader means the process is already over
        if (const std::shared_ptr<ProcessOutputReader> reader{ job.reader.lock() })
        {
            JOB_LOG(job, DEBUG, "Killing encoder...");
            reader->kill();
        }
    }

    bool TranscodeSupervisor::isCurrentJob(JobSlot& slot, const Job& job)
    {
        const std::scoped_lock lock{ slot.mutex };
        return slot.currentJob.get() == &job;
    }

    std::future<void> TranscodeSupervisor::transcode(std::string_view input, const std::filesystem::path& output, const TranscodeOptions& options)
    {
        std::shared_ptr<Job> job;
        std::future<void> future;
        std::shared_ptr<Job> preemptedJob;
        std::shared_ptr<ProcessOutputReader> reader;
        std::optional<EncodingException> startError;
        std::string commandLine;

        {
            const std::scoped_lock lock{ _slot->mutex };

            // the previous process must be dead before spawning the new one
            preemptedJob = transition(*_slot, TranscodeStatus::Idle);
            if (preemptedJob)
                killJobProcess(*preemptedJob);

            job = std::make_shared<Job>(_slot->nextJobId++, options);
            future = job->promise.get_future();

            if (options.seek && options.seek->count() < 0)
            {
                startError.emplace("Invalid seek offset (" + std::to_string(options.seek->count()) + " ms), must not be negative");
            }
            else
            {
                const core::IChildProcess::Args args{ buildEncoderArgs(_executablePaths.encoder, input, output, options.seek) };
                commandLine = core::stringUtils::joinStrings(args, ' ');

                try
                {
                    reader = std::make_shared<ProcessOutputReader>(
                        _childProcessManager.spawnChildProcess(_executablePaths.encoder, args),
                        [slot = _slot, job](core::IChildProcess::OutputStream stream, std::string_view line) { onOutputLine(*slot, *job, stream, line); },
                        [slot = _slot, job](const core::IChildProcess::ExitStatus& exitStatus) { onProcessExit(*slot, job, exitStatus); });

                    job->reader = reader;
                    transition(*_slot, TranscodeStatus::Running, job);
                }
                catch (const core::ChildProcessException& e)
                {
                    startError.emplace("Cannot start encoder '" + _executablePaths.encoder.string() + "': " + e.what());
                }
            }

            if (startError)
                transition(*_slot, TranscodeStatus::Error);
        }

        if (preemptedJob)
        {
            JOB_LOG(*preemptedJob, INFO, "Preempted by job " << job->id);
            preemptedJob->promise.set_exception(std::make_exception_ptr(PreemptedException{}));
        }

        if (startError)
        {
            JOB_LOG(*job, ERROR, startError->what());
            if (options.listener)
                options.listener->onError(*startError);
            job->promise.set_exception(std::make_exception_ptr(*startError));
            return future;
        }

        JOB_LOG(*job, INFO, "Transcoding '" << input << "' to " << output << (options.seek ? ", seek = " + formatSeekOffset(*options.seek) + "s" : ""));
        JOB_LOG(*job, DEBUG, "Command line: " << commandLine);

        // a concurrent call may already have preempted or killed the job
        if (options.listener && isCurrentJob(*_slot, *job))
            options.listener->onStart(commandLine);

        // after onStart, so that progress cannot be reported before
        reader->start();

        return future;
    }

    void TranscodeSupervisor::killProcess()
    {
        cancelCurrentJob();
    }

    void TranscodeSupervisor::cancelCurrentJob()
    {
        std::shared_ptr<Job> job;
        {
            const std::scoped_lock lock{ _slot->mutex };

            if (_slot->status != TranscodeStatus::Running || !_slot->currentJob)
            {
                VTRANS_LOG(TRANSCODING, DEBUG, "No running job to kill");
                return;
            }

            job = transition(*_slot, TranscodeStatus::Idle);
            killJobProcess(*job);
        }

        JOB_LOG(*job, INFO, "Transcoding cancelled");
        job->promise.set_exception(std::make_exception_ptr(JobCancelledException{}));
    }

    TranscodeStatus TranscodeSupervisor::getStatus() const
    {
        const std::scoped_lock lock{ _slot->mutex };
        return _slot->status;
    }

    void TranscodeSupervisor::onOutputLine(JobSlot& slot, Job& job, core::IChildProcess::OutputStream stream, std::string_view line)
    {
        if (stream == core::IChildProcess::OutputStream::Stderr)
        {
            JOB_LOG(job, DEBUG, "Encoder error output: " << line);
            keepErrorLine(job.errorLines, line);
            return;
        }

        const std::optional<Progress> progress{ job.progressParser.parseLine(line) };
        if (!progress)
            return;

        if (!isCurrentJob(slot, job))
            return;

        JOB_LOG(job, DEBUG, "Progress: frame = " << progress->frame.value_or(0)
                                                << ", out time = " << (progress->outTime ? std::chrono::duration_cast<std::chrono::milliseconds>(*progress->outTime).count() : 0) << " ms"
                                                << ", speed = " << progress->speed.value_or(0) << "x");

        if (job.options.listener)
            job.options.listener->onProgress(*progress);
    }

    void TranscodeSupervisor::onProcessExit(JobSlot& slot, const std::shared_ptr<Job>& job, const core::IChildProcess::ExitStatus& exitStatus)
    {
        {
            const std::scoped_lock lock{ slot.mutex };

            // preempted or killed: already settled
            if (slot.currentJob != job)
                return;

            transition(slot, exitStatus.succeeded() ? TranscodeStatus::Ended : TranscodeStatus::Error);
        }

        if (exitStatus.succeeded())
        {
            JOB_LOG(*job, INFO, "Transcoding ended");
            if (job->options.listener)
                job->options.listener->onEnd();
            job->promise.set_value();
            return;
        }

        const EncodingException error{ describeFailure("Encoder", exitStatus, job->errorLines), exitStatus.exitCode };
        JOB_LOG(*job, ERROR, "Transcoding failed: " << error.what());
        if (job->options.listener)
            job->options.listener->onError(error);
        job->promise.set_exception(std::make_exception_ptr(error));
    }

    std::future<MediaMetadata> TranscodeSupervisor::probeMetadata(std::string_view input)
    {
        auto probe{ std::make_shared<Probe>() };
        std::future<MediaMetadata> future{ probe->promise.get_future() };

        const core::IChildProcess::Args args{ buildProberArgs(_executablePaths.prober, input) };
        VTRANS_LOG(PROBE, DEBUG, "Probing '" << input << "': " << core::stringUtils::joinStrings(args, ' '));

        std::shared_ptr<ProcessOutputReader> reader;
        try
        {
            reader = std::make_shared<ProcessOutputReader>(
                _childProcessManager.spawnChildProcess(_executablePaths.prober, args),
                [probe](core::IChildProcess::OutputStream stream, std::string_view line) { onProbeOutputLine(*probe, stream, line); },
                [probe](const core::IChildProcess::ExitStatus& exitStatus) { onProbeExit(*probe, exitStatus); });
        }
        catch (const core::ChildProcessException& e)
        {
            const ProbeException error{ "Cannot start prober '" + _executablePaths.prober.string() + "': " + e.what() };
            VTRANS_LOG(PROBE, ERROR, error.what());
            probe->promise.set_exception(std::make_exception_ptr(error));
            return future;
        }

        reader->start();

        return future;
    }
} // namespace vtrans::av
