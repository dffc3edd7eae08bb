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

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string_view>

#include "av/Exception.hpp"
#include "av/ExecutableResolver.hpp"
#include "av/MediaMetadata.hpp"
#include "av/Progress.hpp"

namespace vtrans::core
{
    class IChildProcessManager;
}

namespace vtrans::av
{
    enum class TranscodeStatus
    {
        Idle,
        Running,
        Ended,
        Error,
    };

    const char* getTranscodeStatusName(TranscodeStatus status);

    // Called from the IO context threads, never while the supervisor holds its lock
    // None of these is called for a job once it was preempted or killed, except an event whose delivery already began
    class ITranscodeListener
    {
    public:
        virtual ~ITranscodeListener() = default;

        virtual void onStart(std::string_view commandLine) = 0;
        virtual void onProgress(const Progress& progress) = 0;
        virtual void onEnd() = 0;
        virtual void onError(const EncodingException& error) = 0;
    };

    struct TranscodeOptions
    {
        std::shared_ptr<ITranscodeListener> listener; // may be null
        std::optional<std::chrono::milliseconds> seek; // input offset, must not be negative
    };

    // Runs at most one encoder at a time, a new request kills the running one
    class ITranscodeSupervisor
    {
    public:
        virtual ~ITranscodeSupervisor() = default;

        // Kills the running job, if any, before starting the new one: its future holds PreemptedException
        // The returned future holds EncodingException if the encoder cannot start or fails
        virtual std::future<void> transcode(std::string_view input, const std::filesystem::path& output, const TranscodeOptions& options = {}) = 0;

        // No-op if no job is running, otherwise its future holds JobCancelledException
        virtual void killProcess() = 0;

        virtual TranscodeStatus getStatus() const = 0;

        // One-shot, independent of the transcode jobs
        // The returned future holds ProbeException on failure
        virtual std::future<MediaMetadata> probeMetadata(std::string_view input) = 0;
    };

    std::unique_ptr<ITranscodeSupervisor> createTranscodeSupervisor(core::IChildProcessManager& childProcessManager, const ExecutablePaths& executablePaths);
} // namespace vtrans::av
