#pragma once

#include <string>

namespace mrec {
    struct TrackResult {
        bool ok = false;
        int status = 0;     // http status, 0 when no response arrived
        std::string error;  // transport error or rejected status
    };

    inline int track_id_for_channel(int nvr_channel) { return nvr_channel * 100 + 1; }

    // Manual recording control of a remote recorder. Implementations must not throw
    // for network failures; they report them through TrackResult.
    class INvrClient {
    public:
        virtual ~INvrClient() = default;
        virtual TrackResult start_track(int track_id) = 0;
        virtual TrackResult stop_track(int track_id) = 0;
    };
}
