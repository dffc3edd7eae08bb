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


#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "core/IChildProcess.hpp"

#include "av/ITranscodeSupervisor.hpp"

namespace vtrans::av
{
    class TranscodeSupervisor : public ITranscodeSupervisor
    {
    public:
        TranscodeSupervisor(core::IChildProcessManager& childProcessManager, const ExecutablePaths& executablePaths);
        ~TranscodeSupervisor() override;
        TranscodeSupervisor(const TranscodeSupervisor&) = delete;
        TranscodeSupervisor& operator=(const TranscodeSupervisor&) = delete;

    private:
        std::future<void> transcode(std::string_view input, const std::filesystem::path& output, const TranscodeOptions& options) override;
        void killProcess() override;
        TranscodeStatus getStatus() const override;
        std::future<MediaMetadata> probeMetadata(std::string_view input) override;

        struct Job;
        struct JobSlot;

        // Only way to change the slot, JobSlot::mutex must be held
        // Any status but Running releases the current job, which is returned
        static std::shared_ptr<Job> transition(JobSlot& slot, TranscodeStatus status, std::shared_ptr<Job> job = {});
        static void killJobProcess(Job& job);
        static bool isCurrentJob(JobSlot& slot, const Job& job);
        void cancelCurrentJob();

        // Called from the IO context threads
        static void onOutputLine(JobSlot& slot, Job& job, core::IChildProcess::OutputStream stream, std::string_view line);
        static void onProcessExit(JobSlot& slot, const std::shared_ptr<Job>& job, const core::IChildProcess::ExitStatus& exitStatus);

        core::IChildProcessManager& _childProcessManager;
        const ExecutablePaths _executablePaths;
        const std::shared_ptr<JobSlot> _slot; // shared with the output handlers, may outlive this
    };
} // namespace vtrans::av
