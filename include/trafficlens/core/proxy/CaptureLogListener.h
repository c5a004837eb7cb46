#pragma once
#include "trafficlens/core/proxy/CapturedRequest.h"
#include "trafficlens/core/proxy/CaptureStore.h"
#include <memory>
#include <string>

namespace trafficlens::core::proxy {
// Logs a one-line summary of every capture at info level.
class CaptureLogListener : public CaptureListener {
public:
    void on_capture(const CapturePtr& capture) override;
    static std::string summarize(const CapturedRequest& c);
};
std::shared_ptr<CaptureLogListener> make_capture_log_listener(CaptureStore& store, ListenerHandle* handle = nullptr);
}
