#include "thumb/ReadySink.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace tf::thumb;

nlohmann::json tf::thumb::readyPayload(const std::vector<std::string>& paths) {
    auto items = nlohmann::json::array();
    for (const auto& p : paths) items.push_back({{"path", p}});
    return {{"items", std::move(items)}};
}

void LoggingReadySink::onThumbnailsReady(const std::vector<std::string>& paths) {
    log::Registry::thumb()->debug("[ReadySink] thumbnail-batch-ready {}", readyPayload(paths).dump());
}
