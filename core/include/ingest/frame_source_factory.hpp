#pragma once

#include <memory>
#include <string>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>

namespace mrec {
    // gst-launch description for a camera locator, exposed for tests
    std::string frame_source_pipeline(const CameraConfig& cam,
                                      const CaptureConfig& cap,
                                      const std::string& sink_name);

    std::unique_ptr<IFrameSource> make_frame_source(const CameraConfig& cam, const CaptureConfig& cap);
}
