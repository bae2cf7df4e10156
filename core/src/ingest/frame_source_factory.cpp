#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace mrec {
    static std::string sink_name_for(const std::string& cam_name) {
        std::string s = "sink_" + cam_name;
        std::replace_if(s.begin(), s.end(),
                        [](unsigned char c) { return !std::isalnum(c) && c != '_'; }, '_');
        return s;
    }

    // latest frame only, decoded to BGR at the target rate
    static std::string common_tail(const CaptureConfig& c, const std::string& sink_name) {
        std::ostringstream ss;
        ss << " ! videoconvert ! videorate drop-only=true"
           << " ! video/x-raw,format=BGR,framerate=" << c.fps << "/1"
           << " ! appsink name=" << sink_name << " max-buffers=1 drop=true sync=false";
        return ss.str();
    }

    static std::string rtsp_pipeline(const std::string& url, const CaptureConfig& c, const std::string& sink_name) {
        std::string proto = c.tcp ? "tcp" : "udp";
        return "rtspsrc location=\"" + url +
               "\" latency=" + std::to_string(c.latency_ms) +
               " protocols=" + proto + " drop-on-latency=true"
               " tcp-timeout=" + std::to_string(static_cast<int64_t>(c.read_timeout_ms) * 1000) +
               " ! decodebin" + common_tail(c, sink_name);
    }

    static std::string webcam_pipeline(const std::string& device, const CaptureConfig& c, const std::string& sink_name) {
        return "v4l2src device=" + device + common_tail(c, sink_name);
    }

    static std::string file_pipeline(const std::string& path, const CaptureConfig& c, const std::string& sink_name) {
        namespace fs = std::filesystem;
        const std::string abs = fs::absolute(path).string();
        return "uridecodebin uri=\"file://" + abs + "\"" + common_tail(c, sink_name);
    }

    std::string frame_source_pipeline(const CameraConfig& cam,
                                      const CaptureConfig& cap,
                                      const std::string& sink_name) {
        const std::string& loc = cam.stream;
        if (loc.empty()) {
            throw std::runtime_error("stream locator is empty for camera " + cam.name);
        }
        if (loc.rfind("rtsp://", 0) == 0 || loc.rfind("rtsps://", 0) == 0) {
            return rtsp_pipeline(loc, cap, sink_name);
        }
        if (loc.rfind("/dev/video", 0) == 0) {
            return webcam_pipeline(loc, cap, sink_name);
        }
        return file_pipeline(loc, cap, sink_name);
    }

    std::unique_ptr<IFrameSource> make_frame_source(const CameraConfig& cam, const CaptureConfig& cap) {
        const std::string sink_name = sink_name_for(cam.name);
        return std::make_unique<GstFrameSource>(frame_source_pipeline(cam, cap, sink_name), cam.name, sink_name);
    }
}
