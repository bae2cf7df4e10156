#include <common/config.hpp>
#include <nvr/isapi_client.hpp>
#include <pipeline/runtime.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "config.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    mrec::AppConfig cfg;
    try {
        cfg = mrec::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        std::cerr << "Copy configs/config.example.yaml to " << cfg_path << " and edit it.\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    mrec::IsapiNvrClient nvr(cfg.nvr);

    mrec::Orchestrator::Options opt;
    opt.capture = cfg.capture;
    opt.detector = cfg.detector;
    opt.runtime = cfg.runtime;

    std::cout << "Starting motion detectors...\n";
    mrec::Orchestrator orchestrator(cfg.cameras, nvr, opt);
    if (!orchestrator.start()) {
        std::cerr << "Failed to start cameras\n";
        return 1;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    orchestrator.stop();
    std::cout << "Stopped all cams\n";

    return 0;
}
