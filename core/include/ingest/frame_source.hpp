#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace mrec {

    struct FramePacket {
        cv::Mat bgr;
        int64_t pts_ns = 0;
        int64_t frame_id = 0;
    };

    struct IFrameSource {
        virtual ~IFrameSource() = default;
        virtual bool start() = 0;
        virtual void stop() = 0;
        virtual bool read(FramePacket& out, int timeout_ms) = 0;
        // false once the stream hit an error/EOS or was stopped
        virtual bool is_open() const = 0;
        virtual const std::string& id() const = 0;
    };
}
