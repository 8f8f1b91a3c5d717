#include "thumb/Index.hpp"
#include "thumb/Store.hpp"
#include "log/Registry.hpp"

#include <mutex>

using namespace tf::thumb;
using namespace tf::types;

void PathSet::insert(const std::string& path) {
    std::unique_lock lock(mutex_);
    paths_.insert(path);
}

void PathSet::insert(const std::vector<std::string>& paths) {
    std::unique_lock lock(mutex_);
    paths_.insert(paths.begin(), paths.end());
}

bool PathSet::erase(const std::string& path) {
    std::unique_lock lock(mutex_);
    return paths_.erase(path) > 0;
}

size_t PathSet::eraseIf(const std::function<bool(const std::string&)>& pred) {
    std::unique_lock lock(mutex_);
    return std::erase_if(paths_, pred);
}

bool PathSet::contains(const std::string& path) const {
    std::shared_lock lock(mutex_);
    return paths_.contains(path);
}

size_t PathSet::size() const {
    std::shared_lock lock(mutex_);
    return paths_.size();
}

void PathSet::clear() {
    std::unique_lock lock(mutex_);
    paths_.clear();
}

void Index::load(Store& store) {
    const auto files = store.listKeysByCategory(Category::File);
    const auto dirs = store.listKeysByCategory(Category::Folder);
    const auto bad = store.listFailedKeys();

    present.insert(files);
    present.insert(dirs);
    folders.insert(dirs);
    failed.insert(bad);

    log::Registry::cache()->info("[Index] Loaded {} file, {} folder and {} failed keys",
                                 files.size(), dirs.size(), bad.size());
}

void Index::erase(const std::string& path) {
    present.erase(path);
    folders.erase(path);
    failed.erase(path);
}

size_t Index::eraseIfPrefix(const std::string& prefix) {
    const auto pred = [&prefix](const std::string& p) { return p.starts_with(prefix); };
    const auto n = present.eraseIf(pred);
    folders.eraseIf(pred);
    failed.eraseIf(pred);
    return n;
}

void Index::clear() {
    present.clear();
    folders.clear();
    failed.clear();
}
