#include "combine/segment_joiner.h"
#include "logger.h"
#include "utils/process_runner.h"
#include <filesystem>
#include <fstream>

namespace pem {

FfmpegConcatJoiner::FfmpegConcatJoiner(std::string ffmpegCommand, std::chrono::seconds timeout)
    : ffmpegCommand_(std::move(ffmpegCommand)), timeout_(timeout) {
}

std::string FfmpegConcatJoiner::buildConcatList(const std::vector<std::string>& inputs) {
    std::string list;
    for (const auto& input : inputs) {
        std::string escaped;
        for (char c : input) {
            if (c == '\'') {
                escaped += "'\\''";
            } else {
                escaped += c;
            }
        }
        list += "file '" + escaped + "'\n";
    }
    return list;
}

bool FfmpegConcatJoiner::join(const std::vector<std::string>& inputs, const std::string& output,
                              std::string& error) {
    if (inputs.empty()) {
        error = "nothing to join";
        return false;
    }

    std::string listPath = output + ".concat.txt";
    {
        std::ofstream list(listPath, std::ios::out | std::ios::trunc);
        if (!list.is_open()) {
            error = "cannot write concat list " + listPath;
            return false;
        }
        list << buildConcatList(inputs);
        if (!list.good()) {
            error = "cannot write concat list " + listPath;
            return false;
        }
    }

    std::vector<std::string> args = {
        "-hide_banner", "-loglevel", "error", "-nostdin", "-n",
        "-f", "concat", "-safe", "0",
        "-i", listPath,
        "-c", "copy", "-map", "0",
        output
    };

    LOG_DEBUG("SegmentJoiner", "Joining " + std::to_string(inputs.size()) + " files into " + output);
    auto result = utils::CommandRunner::run(
        ffmpegCommand_, args, std::chrono::duration_cast<std::chrono::milliseconds>(timeout_));

    std::error_code ec;
    std::filesystem::remove(listPath, ec);

    if (!result.success()) {
        error = ffmpegCommand_ + " exited with " + std::to_string(result.exitCode) +
                (result.timedOut ? " (timeout)" : "") + ": " + result.stderrText;
        return false;
    }
    return true;
}

bool BinaryConcatJoiner::join(const std::vector<std::string>& inputs, const std::string& output,
                              std::string& error) {
    if (inputs.empty()) {
        error = "nothing to join";
        return false;
    }

    std::ofstream out(output, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        error = "cannot open " + output + " for writing";
        return false;
    }

    for (const auto& input : inputs) {
        std::ifstream in(input, std::ios::binary);
        if (!in.is_open()) {
            error = "cannot open " + input;
            return false;
        }
        if (in.peek() == std::ifstream::traits_type::eof()) {
            continue;  // inserting an empty streambuf would set failbit
        }
        out << in.rdbuf();
        if (!out.good()) {
            error = "write failed while appending " + input;
            return false;
        }
    }

    out.flush();
    if (!out.good()) {
        error = "flush failed for " + output;
        return false;
    }
    return true;
}

} // namespace pem
