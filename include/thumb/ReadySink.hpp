#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tf::thumb {

// Receives batched "thumbnails ready" notifications. Called from worker and
// loader threads; implementations must be thread safe and must not block.
class ReadySink {
public:
    virtual ~ReadySink() = default;

    virtual void onThumbnailsReady(const std::vector<std::string>& paths) = 0;
};

// {"items": [{"path": ...}, ...]}
nlohmann::json readyPayload(const std::vector<std::string>& paths);

class LoggingReadySink final : public ReadySink {
public:
    void onThumbnailsReady(const std::vector<std::string>& paths) override;
};

}
