#include <common/config.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <unordered_set>

#include <yaml-cpp/yaml.h>

namespace mrec {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    constexpr double kMaxSeconds = 7.0 * 24.0 * 3600.0;

    // seconds in yaml, fractional allowed
    static std::chrono::milliseconds get_seconds(
        const YAML::Node& n, const char* key, std::chrono::milliseconds def) {
        if (!n || !n[key]) return def;
        const double s = n[key].as<double>();
        if (!std::isfinite(s)) {
            throw std::runtime_error(std::string("[Config] ") + key + " must be a finite number!");
        }
        if (s < 0.0) {
            throw std::runtime_error(std::string("[Config] ") + key + " must not be negative!");
        }
        if (s > kMaxSeconds) {
            throw std::runtime_error(std::string("[Config] ") + key + " exceeds one week!");
        }
        return std::chrono::milliseconds(static_cast<int64_t>(std::llround(s * 1000.0)));
    }

    static std::chrono::milliseconds get_ms(
        const YAML::Node& n, const char* key, std::chrono::milliseconds def) {
        return std::chrono::milliseconds(get_int(n, key, static_cast<int>(def.count())));
    }

    static NvrConfig parse_nvr_config(const YAML::Node& n) {
        NvrConfig c;
        if (!n) {
            throw std::runtime_error("[Config] missing nvr section!");
        }
        c.ip = get_str(n, "ip", "");
        c.port = get_int(n, "port", c.port);
        c.user = get_str(n, "user", "");
        c.pass = get_str(n, "pass", "");
        c.timeout_ms = get_int(n, "timeout_ms", c.timeout_ms);
        c.accept_any_status = get_bool(n, "accept_any_status", c.accept_any_status);

        if (c.ip.empty()) {
            throw std::runtime_error("[Config] nvr.ip is empty!");
        }
        if (c.timeout_ms <= 0) {
            throw std::runtime_error("[Config] nvr.timeout_ms must be positive!");
        }
        return c;
    }

    static CaptureConfig parse_capture_config(const YAML::Node& n) {
        CaptureConfig c;
        if (!n) return c;
        const std::string transport = get_str(n, "transport", "tcp");
        if (transport != "tcp" && transport != "udp") {
            throw std::runtime_error("[Config] capture.transport must be tcp or udp!");
        }
        c.tcp = transport == "tcp";
        c.latency_ms = get_int(n, "latency_ms", c.latency_ms);
        c.fps = get_int(n, "fps", c.fps);
        c.read_timeout_ms = get_int(n, "read_timeout_ms", c.read_timeout_ms);
        if (c.fps <= 0) {
            throw std::runtime_error("[Config] capture.fps must be positive!");
        }
        if (c.read_timeout_ms <= 0) {
            throw std::runtime_error("[Config] capture.read_timeout_ms must be positive!");
        }
        return c;
    }

    static DetectorConfig parse_detector_config(const YAML::Node& n) {
        DetectorConfig c;
        if (!n) return c;
        c.pixel_threshold = get_int(n, "pixel_threshold", c.pixel_threshold);
        c.blur_kernel = get_int(n, "blur_kernel", c.blur_kernel);
        c.dilate_iterations = get_int(n, "dilate_iterations", c.dilate_iterations);
        c.refresh_interval = get_int(n, "refresh_interval", c.refresh_interval);
        c.quiet_ratio = get_double(n, "quiet_ratio", c.quiet_ratio);
        if (c.refresh_interval <= 0) {
            throw std::runtime_error("[Config] detector.refresh_interval must be positive!");
        }
        if (c.quiet_ratio < 0.0) {
            throw std::runtime_error("[Config] detector.quiet_ratio must not be negative!");
        }
        return c;
    }

    static RuntimeConfig parse_runtime_config(const YAML::Node& n) {
        RuntimeConfig c;
        if (!n) return c;
        c.frame_interval = get_ms(n, "frame_interval_ms", c.frame_interval);
        c.reconnect_backoff = get_ms(n, "reconnect_backoff_ms", c.reconnect_backoff);
        c.max_read_failures = get_int(n, "max_read_failures", c.max_read_failures);
        c.watchdog_poll = get_ms(n, "watchdog_poll_ms", c.watchdog_poll);
        c.dispatch_workers = get_int(n, "dispatch_workers", c.dispatch_workers);
        c.dispatch_queue = get_int(n, "dispatch_queue", c.dispatch_queue);
        if (c.dispatch_workers <= 0 || c.dispatch_queue <= 0) {
            throw std::runtime_error("[Config] runtime.dispatch_workers/dispatch_queue must be positive!");
        }
        if (c.watchdog_poll.count() <= 0) {
            throw std::runtime_error("[Config] runtime.watchdog_poll_ms must be positive!");
        }
        if (c.max_read_failures < 1) c.max_read_failures = 1;
        return c;
    }

    static CameraConfig parse_camera_config(const YAML::Node& n, std::chrono::milliseconds cooldown) {
        CameraConfig c;
        c.name = get_str(n, "name", "");
        c.stream = get_str(n, "rtsp", get_str(n, "stream", ""));
        c.nvr_channel = get_int(n, "nvr_channel", 0);
        c.threshold = get_double(n, "threshold", c.threshold);
        c.no_motion_timeout = get_seconds(n, "no_motion_timeout", c.no_motion_timeout);
        c.cooldown = get_seconds(n, "cooldown", cooldown);

        if (c.name.empty()) {
            throw std::runtime_error("[Config] camera without name!");
        }
        if (c.stream.empty()) {
            throw std::runtime_error("[Config] camera " + c.name + " has empty stream URL!");
        }
        if (c.nvr_channel < 1) {
            throw std::runtime_error("[Config] camera " + c.name + " needs nvr_channel >= 1!");
        }
        if (c.threshold <= 0.0) {
            throw std::runtime_error("[Config] camera " + c.name + " threshold must be positive!");
        }
        if (c.no_motion_timeout.count() <= 0) {
            throw std::runtime_error("[Config] camera " + c.name + " no_motion_timeout must be positive!");
        }
        return c;
    }

    static AppConfig parse_root(const YAML::Node& root) {
        AppConfig cfg;
        cfg.nvr = parse_nvr_config(root["nvr"]);
        cfg.cooldown = get_seconds(root, "cooldown", cfg.cooldown);
        cfg.capture = parse_capture_config(root["capture"]);
        cfg.detector = parse_detector_config(root["detector"]);
        cfg.runtime = parse_runtime_config(root["runtime"]);

        auto arr = root["cameras"];
        if (!arr || !arr.IsSequence() || arr.size() == 0) {
            throw std::runtime_error("[Config] no cameras specified!");
        }

        std::unordered_set<std::string> names;
        for (const auto& c : arr) {
            CameraConfig cam = parse_camera_config(c, cfg.cooldown);
            if (!names.insert(cam.name).second) {
                throw std::runtime_error("[Config] duplicate camera name " + cam.name + "!");
            }
            cfg.cameras.push_back(std::move(cam));
        }
        return cfg;
    }

    AppConfig load_config_yaml(const std::string& path) {
        return parse_root(YAML::LoadFile(path));
    }

    AppConfig parse_config_yaml(const std::string& yaml) {
        return parse_root(YAML::Load(yaml));
    }
}
