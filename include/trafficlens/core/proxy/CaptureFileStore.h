#pragma once
#include "trafficlens/core/proxy/CapturedRequest.h"
#include "trafficlens/core/proxy/CaptureStore.h"
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace trafficlens::core::proxy {
// Appends every capture to a file as one JSON object per line. Bodies are base64.
class CaptureFileStore : public CaptureListener {
public:
    explicit CaptureFileStore(const std::string& path);
    bool is_open() const { return ofs.is_open(); }
    void on_capture(const CapturePtr& capture) override;

    static std::string to_json(const CapturedRequest& c);
    static std::string escape_json(std::string_view in);
    static std::string b64(std::string_view in);

private:
    std::mutex mu;
    std::ofstream ofs;
};

// Opens `path` and subscribes the file store to `store`. Throws std::runtime_error
// when the file cannot be opened.
std::shared_ptr<CaptureFileStore> make_file_store(CaptureStore& store, const std::string& path, ListenerHandle* handle = nullptr);
}
