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


#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Platform.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"

#include "av/Exception.hpp"
#include "av/ExecutableResolver.hpp"
#include "av/ITranscodeSupervisor.hpp"
#include "av/NeedsTranscoding.hpp"

namespace vtrans
{
    namespace
    {
        // Progress is displayed on a single line
        class ConsoleListener : public av::ITranscodeListener
        {
        private:
            void onStart(std::string_view commandLine) override
            {
                const std::scoped_lock lock{ _mutex };
                std::cout << "Running: " << commandLine << std::endl;
            }

            void onProgress(const av::Progress& progress) override
            {
                const std::scoped_lock lock{ _mutex };

                std::cout << "\rframe = " << progress.frame.value_or(0);
                if (progress.outTime)
                    std::cout << ", time = " << std::fixed << std::setprecision(2) << std::chrono::duration_cast<std::chrono::duration<float>>(*progress.outTime).count() << "s";
                if (progress.bitrate)
                    std::cout << ", bitrate = " << std::fixed << std::setprecision(1) << *progress.bitrate << " kbit/s";
                if (progress.speed)
                    std::cout << ", speed = " << std::fixed << std::setprecision(2) << *progress.speed << "x";
                std::cout << "   " << std::flush;
            }

            void onEnd() override
            {
                const std::scoped_lock lock{ _mutex };
                std::cout << "\nDone" << std::endl;
            }

            void onError(const av::EncodingException& error) override
            {
                const std::scoped_lock lock{ _mutex };
                std::cout << std::endl;
                std::cerr << "Transcoding failed: " << error.what() << std::endl;
            }

            std::mutex _mutex;
        };

        void displayMetadata(const av::MediaMetadata& metadata)
        {
            std::cout << "Format: " << core::stringUtils::joinStrings(metadata.formatNames, ", ") << std::endl;
            if (metadata.duration)
                std::cout << "Duration: " << std::fixed << std::setprecision(3) << std::chrono::duration_cast<std::chrono::duration<float>>(*metadata.duration).count() << "s" << std::endl;
            if (metadata.bitrate)
                std::cout << "Bitrate: " << *metadata.bitrate << " bps" << std::endl;

            std::cout << "Streams: " << metadata.streams.size() << std::endl;
            for (const av::StreamInfo& stream : metadata.streams)
            {
                std::cout << "\t#" << stream.index << ": " << av::getStreamTypeName(stream.type) << " (" << (stream.codecName.empty() ? "?" : stream.codecName) << ")";
                if (stream.width && stream.height)
                    std::cout << ", " << *stream.width << "x" << *stream.height;
                if (stream.sampleRate)
                    std::cout << ", " << *stream.sampleRate << " Hz";
                if (stream.channelCount)
                    std::cout << ", " << *stream.channelCount << " channels";
                std::cout << std::endl;
            }

            VTRANS_LOG(PROBE, DEBUG, "Raw metadata: " << metadata.rawJson);
        }
    } // namespace
} // namespace vtrans

int main(int argc, char* argv[])
{
    try
    {
        using namespace vtrans;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf,c", program_options::value<std::string>(), "Configuration file")
            ("seek,s", program_options::value<double>(), "Start offset in the input, in seconds")
            ("force,f", "Transcode even if the input is already playable")
            ("probe,p", "Display the input metadata and exit");
        // clang-format on

        program_options::options_description hiddenOptions{ "Hidden options" };
        hiddenOptions.add_options()("file", program_options::value<std::vector<std::string>>()->composing(), "file");

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("file", 2); // input, then optional output

        program_options::variables_map vm;
        program_options::store(program_options::command_line_parser(argc, argv)
                                   .options(allOptions)
                                   .positional(positional)
                                   .run(),
                               vm);

        program_options::notify(vm);

        auto displayHelp = [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] input [output]" << std::endl;
            os << options << std::endl;
        };

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        if (vm.count("file") == 0)
        {
            std::cerr << "No input file provided" << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        const auto& files{ vm["file"].as<std::vector<std::string>>() };
        const std::string& input{ files.front() };

        core::Service<core::IConfig> config;
        if (vm.count("conf"))
            config.assign(core::createConfig(vm["conf"].as<std::string>()));

        auto getConfigString = [&](std::string_view setting, std::string_view def) { return config.exists() ? std::string{ config->getString(setting, def) } : std::string{ def }; };
        auto getConfigPath = [&](std::string_view setting, const std::filesystem::path& def) { return config.exists() ? config->getPath(setting, def) : def; };
        auto getConfigULong = [&](std::string_view setting, unsigned long def) { return config.exists() ? config->getULong(setting, def) : def; };

        const std::string minSeverityName{ getConfigString("log-min-severity", core::logging::getSeverityName(core::logging::defaultMinSeverity)) };
        const std::optional<core::logging::Severity> minSeverity{ core::logging::parseSeverity(minSeverityName) };
        if (!minSeverity)
        {
            std::cerr << "Invalid log-min-severity value '" << minSeverityName << "'" << std::endl;
            return EXIT_FAILURE;
        }
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(*minSeverity, getConfigPath("log-file", "")) };

        const core::Platform platform{ core::getHostPlatform() };
        VTRANS_LOG(MAIN, INFO, "Starting vtrans on " << platform.os << " (" << platform.arch << ")");

        std::filesystem::path output;
        if (files.size() > 1)
            output = files[1];
        else
            output = std::filesystem::path{ input }.replace_extension(".mp4");

        if (!vm.count("probe"))
        {
            if (!vm.count("force") && !av::needsTranscoding(input))
            {
                std::cout << "'" << input << "' does not need transcoding, use --force to transcode anyway" << std::endl;
                return EXIT_SUCCESS;
            }

            if (output == std::filesystem::path{ input })
            {
                std::cerr << "Output would overwrite input, please provide an output file" << std::endl;
                return EXIT_FAILURE;
            }
        }

        const av::ExecutablePaths executablePaths{ av::resolveExecutablePaths(platform, getConfigPath("vendor-dir", core::getExecutableDirectory() / "vendor")) };

        boost::asio::io_context ioContext;
        core::IOContextRunner ioContextRunner{ ioContext, std::max<unsigned long>(getConfigULong("io-thread-count", 1), 1), "Main" };
        std::unique_ptr<core::IChildProcessManager> childProcessManager{ core::createChildProcessManager(ioContext) };
        std::unique_ptr<av::ITranscodeSupervisor> supervisor{ av::createTranscodeSupervisor(*childProcessManager, executablePaths) };

        if (vm.count("probe"))
        {
            displayMetadata(supervisor->probeMetadata(input).get());
            return EXIT_SUCCESS;
        }

        av::TranscodeOptions transcodeOptions;
        transcodeOptions.listener = std::make_shared<ConsoleListener>();
        if (vm.count("seek"))
            transcodeOptions.seek = std::chrono::milliseconds{ std::llround(vm["seek"].as<double>() * 1'000) };

        std::future<void> result{ supervisor->transcode(input, output, transcodeOptions) };
        try
        {
            result.get();
        }
        catch (const av::EncodingException&)
        {
            // already reported by the listener
            return EXIT_FAILURE;
        }

        VTRANS_LOG(MAIN, INFO, "Output written to " << output);
    }
    catch (const boost::program_options::error& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
