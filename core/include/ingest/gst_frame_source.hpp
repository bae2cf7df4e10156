#pragma once

#include <ingest/frame_source.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;
struct _GstBus;
using GstBus = _GstBus;

namespace mrec {
    class GstFrameSource: public IFrameSource {
    public:
        GstFrameSource(std::string pipeline, std::string src_id, std::string sink_name);

        bool start() override;
        void stop() override;
        bool read(FramePacket& out, int timeout_ms = 1000) override;
        bool is_open() const override { return pipeline_ != nullptr && !failed_; }
        const std::string& id() const override { return id_ ;};

        const std::string& pipeline_description() const { return pipeline_str_; }

        ~GstFrameSource() override;

    private:
        void poll_bus_();

        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;
        GstBus* bus_ = nullptr;

        bool failed_ = false;
        int64_t frame_id_ = 0;
    };
}
