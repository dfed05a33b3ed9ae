#include "fake_process_runner.hpp"

#include "random_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace vidtool::tests
{
    std::string probe_json(const FakeMedia& media)
    {
        std::ostringstream out;
        out << "{\n  \"streams\": [\n";
        int index = 0;
        bool first = true;
        const auto separator = [&] {
            if (!first)
                out << ",\n";
            first = false;
        };
        if (media.video)
        {
            separator();
            out << "    {\"index\": " << index++ << ", \"codec_name\": \"" << media.vcodec
                << "\", \"codec_type\": \"video\", \"width\": " << media.width
                << ", \"height\": " << media.height << ", \"pix_fmt\": \"yuv420p\"}";
        }
        if (!media.acodec.empty())
        {
            separator();
            out << "    {\"index\": " << index++ << ", \"codec_name\": \"" << media.acodec
                << "\", \"codec_type\": \"audio\", \"channels\": 2, \"channel_layout\": \"stereo\"}";
        }
        if (media.subtitles)
        {
            separator();
            out << "    {\"index\": " << index++ << ", \"codec_name\": \"subrip\", \"codec_type\": \"subtitle\"}";
        }
        if (media.data)
        {
            separator();
            out << "    {\"index\": " << index++ << ", \"codec_name\": \"bin_data\", \"codec_type\": \"data\"}";
        }
        out << "\n  ],\n  \"format\": {\"format_name\": \"matroska,webm\", \"format_long_name\": \"Matroska / WebM\", "
            << "\"duration\": \"" << media.duration << "\", \"size\": \"1000\", \"bit_rate\": \"128000\"}\n}\n";
        return out.str();
    }

    ProcessOutcome FakeProcessRunner::run(const ProcessRequest& request, std::stop_token stop)
    {
        Handler handler;
        {
            std::lock_guard lock(mtx_);
            requests_.push_back(request);
            handler = handler_;
        }
        if (!handler)
            return ProcessOutcome{.exit_code = 0};
        return handler(request, stop);
    }

    void FakeProcessRunner::set_handler(Handler handler)
    {
        std::lock_guard lock(mtx_);
        handler_ = std::move(handler);
    }

    std::vector<ProcessRequest> FakeProcessRunner::requests() const
    {
        std::lock_guard lock(mtx_);
        return requests_;
    }

    std::size_t FakeProcessRunner::calls_to(const std::string& name) const
    {
        std::lock_guard lock(mtx_);
        return static_cast<std::size_t>(std::ranges::count_if(requests_, [&name](const ProcessRequest& r) {
            return r.program.filename() == name;
        }));
    }

    ProcessOutcome FakeMediaTools::operator()(const ProcessRequest& request, std::stop_token stop) const
    {
        ProcessOutcome outcome;
        if (stop.stop_requested())
        {
            outcome.interrupted = true;
            return outcome;
        }

        if (request.program.filename() == "ffprobe")
        {
            const fs::path file{ request.args.back() };
            const std::string name{ file.filename().string() };
            if (unprobeable.contains(name))
            {
                outcome.exit_code = 1;
                return outcome;
            }
            const auto it{ media.find(name) };
            outcome.exit_code = 0;
            outcome.output = probe_json(it != media.end() ? it->second : default_media);
            return outcome;
        }

        // transcode tool: "-i <input>" ... "<output>"
        const auto input_it{ std::ranges::find(request.args, std::string{ "-i" }) };
        const fs::path input{ input_it != request.args.end() ? *(input_it + 1) : std::string{} };
        const fs::path output{ request.args.back() };

        for (const auto& line : progress_lines)
        {
            outcome.output += line + "\n";
            if (request.on_line)
                request.on_line(line);
        }

        if (failing.contains(input.filename().string()))
        {
            outcome.output += "Error while decoding stream #0:0\n";
            outcome.exit_code = 1;
            return outcome;
        }

        std::ofstream{ output } << "encoded " << input.filename().string();
        outcome.exit_code = 0;
        return outcome;
    }

    ScopedTempDir::ScopedTempDir()
        : _path{ fs::temp_directory_path() / ("vidtool-test-" + RandomUtils::random_suffix()) }
    {
        fs::create_directories(_path);
    }

    ScopedTempDir::~ScopedTempDir()
    {
        std::error_code ec;
        fs::remove_all(_path, ec);
    }

    fs::path ScopedTempDir::write(const fs::path& relative, const std::string& content) const
    {
        const fs::path full{ _path / relative };
        fs::create_directories(full.parent_path());
        std::ofstream{ full } << content;
        return full;
    }
} // namespace vidtool::tests
