#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pem {

/**
 * @brief Joins recording files end to end without re-encoding
 */
class SegmentJoiner {
public:
    virtual ~SegmentJoiner() = default;

    /**
     * @brief Concatenate inputs, in order, into a new output file
     *
     * @param inputs Paths of the files to join, in time order
     * @param output Path of the file to create; must not exist yet
     * @param error Receives a description when the join fails
     * @return true on success, false otherwise
     */
    virtual bool join(const std::vector<std::string>& inputs, const std::string& output,
                      std::string& error) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Joins via the ffmpeg concat demuxer with stream copy
 *
 * Runs `ffmpeg -f concat -safe 0 -i <list> -c copy -map 0 <output>`, which
 * remuxes MP4 and similar containers without touching the encoded streams.
 */
class FfmpegConcatJoiner : public SegmentJoiner {
public:
    FfmpegConcatJoiner(std::string ffmpegCommand, std::chrono::seconds timeout);

    bool join(const std::vector<std::string>& inputs, const std::string& output,
              std::string& error) override;

    std::string name() const override { return "ffmpeg"; }

    /**
     * @brief Contents of the concat list file for the given inputs
     */
    static std::string buildConcatList(const std::vector<std::string>& inputs);

private:
    std::string ffmpegCommand_;
    std::chrono::seconds timeout_;
};

/**
 * @brief Joins by appending raw bytes
 *
 * Only valid for stream containers that tolerate concatenation (MPEG-TS,
 * raw elementary streams).
 */
class BinaryConcatJoiner : public SegmentJoiner {
public:
    bool join(const std::vector<std::string>& inputs, const std::string& output,
              std::string& error) override;

    std::string name() const override { return "binary"; }
};

} // namespace pem
