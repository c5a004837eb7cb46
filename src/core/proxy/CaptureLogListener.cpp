#include "trafficlens/core/proxy/CaptureLogListener.h"
#include "trafficlens/core/util/Logger.h"
#include <fmt/format.h>

namespace trafficlens::core::proxy {
using util::Logger;

std::string CaptureLogListener::summarize(const CapturedRequest& c) {
    if (!c.error.empty()) {
        return fmt::format("#{} {} {} -> error: {} ({} ms)", c.id, c.method, c.url, c.error, c.duration.count());
    }
    return fmt::format("#{} {} {} -> {} req {}B resp {}B ({} ms){}", c.id, c.method, c.url, c.statusCode,
                       c.requestSize, c.responseSize, c.duration.count(), c.isHttps ? " tls" : "");
}

void CaptureLogListener::on_capture(const CapturePtr& capture) {
    if (!capture) return;
    Logger::instance().log(Logger::Level::info, summarize(*capture));
}

std::shared_ptr<CaptureLogListener> make_capture_log_listener(CaptureStore& store, ListenerHandle* handle) {
    auto o = std::make_shared<CaptureLogListener>();
    auto h = store.add_listener(o);
    if (handle) *handle = h;
    return o;
}
}
