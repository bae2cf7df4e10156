#pragma once

#include <common/config.hpp>
#include <nvr/nvr_client.hpp>

#include <string>

namespace mrec {
    // Hikvision ISAPI: PUT /ISAPI/ContentMgmt/record/control/manual/{start|stop}/tracks/{id}
    class IsapiNvrClient : public INvrClient {
    public:
        explicit IsapiNvrClient(NvrConfig cfg);

        TrackResult start_track(int track_id) override;
        TrackResult stop_track(int track_id) override;

        static std::string control_path(const std::string& action, int track_id);

    private:
        TrackResult put_(const std::string& path);

        NvrConfig cfg_;
    };
}
