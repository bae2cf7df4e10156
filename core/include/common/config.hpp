#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace mrec {
    struct NvrConfig {
        std::string ip;
        int port = 80;
        std::string user;
        std::string pass;
        int timeout_ms = 5000;
        bool accept_any_status = false; // treat every completed request as success
    };

    struct CameraConfig {
        std::string name;
        std::string stream; // rtsp://..., /dev/videoN or a file path
        int nvr_channel = 1;
        double threshold = 500.0; // motion area in pixels
        std::chrono::milliseconds no_motion_timeout{10000};
        std::chrono::milliseconds cooldown{30000};
    };

    struct CaptureConfig {
        bool tcp = true;
        int latency_ms = 200;
        int fps = 15;
        int read_timeout_ms = 5000;
    };

    struct DetectorConfig {
        int pixel_threshold = 25;
        int blur_kernel = 21;
        int dilate_iterations = 2;
        int refresh_interval = 300; // frames
        double quiet_ratio = 0.1;   // of camera threshold
    };

    struct RuntimeConfig {
        std::chrono::milliseconds frame_interval{33};
        std::chrono::milliseconds reconnect_backoff{2000};
        int max_read_failures = 50;
        std::chrono::milliseconds watchdog_poll{1000};
        int dispatch_workers = 2; // per camera
        int dispatch_queue = 16;  // per camera
    };

    struct AppConfig {
        NvrConfig nvr;
        std::chrono::milliseconds cooldown{30000};
        std::vector<CameraConfig> cameras;
        CaptureConfig capture;
        DetectorConfig detector;
        RuntimeConfig runtime;
    };

    AppConfig load_config_yaml(const std::string& path);
    AppConfig parse_config_yaml(const std::string& yaml);
}
