#include <nvr/isapi_client.hpp>

#include <httplib.h>

namespace mrec {
    IsapiNvrClient::IsapiNvrClient(NvrConfig cfg) : cfg_(std::move(cfg)) {}

    std::string IsapiNvrClient::control_path(const std::string& action, int track_id) {
        return "/ISAPI/ContentMgmt/record/control/manual/" + action + "/tracks/" + std::to_string(track_id);
    }

    TrackResult IsapiNvrClient::start_track(int track_id) {
        return put_(control_path("start", track_id));
    }

    TrackResult IsapiNvrClient::stop_track(int track_id) {
        return put_(control_path("stop", track_id));
    }

    TrackResult IsapiNvrClient::put_(const std::string& path) {
        TrackResult r;

        // one client per call: start/stop of different cameras run on different threads
        httplib::Client client(cfg_.ip, cfg_.port);
        const time_t sec = cfg_.timeout_ms / 1000;
        const time_t usec = static_cast<time_t>(cfg_.timeout_ms % 1000) * 1000;
        client.set_connection_timeout(sec, usec);
        client.set_read_timeout(sec, usec);
        client.set_write_timeout(sec, usec);
        if (!cfg_.user.empty()) {
            client.set_basic_auth(cfg_.user.c_str(), cfg_.pass.c_str());
        }

        auto res = client.Put(path.c_str(), std::string(), "application/xml");
        if (!res) {
            r.error = httplib::to_string(res.error());
            return r;
        }

        r.status = res->status;
        if (cfg_.accept_any_status || (res->status >= 200 && res->status < 300)) {
            r.ok = true;
        } else {
            r.error = "http status " + std::to_string(res->status);
        }
        return r;
    }
}
