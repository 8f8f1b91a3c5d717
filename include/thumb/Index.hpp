#pragma once

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace tf::thumb {

class Store;

class PathSet {
public:
    void insert(const std::string& path);
    void insert(const std::vector<std::string>& paths);
    bool erase(const std::string& path);
    size_t eraseIf(const std::function<bool(const std::string&)>& pred);

    [[nodiscard]] bool contains(const std::string& path) const;
    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_set<std::string> paths_;
};

// In-memory mirror of what the store holds. Rebuilt by load(), then kept
// current by the workers; never persisted itself.
struct Index {
    PathSet present;
    PathSet folders;
    PathSet failed;

    void load(Store& store);
    void erase(const std::string& path);
    size_t eraseIfPrefix(const std::string& prefix);
    void clear();
};

}
