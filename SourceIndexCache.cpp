// SourceIndexCache.cpp
#include "SourceIndexCache.hpp"
#include "LineClassifier.hpp"
#include "SourceBuffer.hpp"
#include "TextIO.hpp"
#include <mutex>

ClassificationPtr SourceIndexCache::get_or_build(const SourceBuffer& buffer) {
    const std::string& path = buffer.path();
    const uint64_t fingerprint = buffer.fingerprint();

    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = entries.find(path);
        if (it != entries.end() && it->second->fingerprint == fingerprint) {
            return it->second;
        }
    }

    std::promise<ClassificationPtr> promise;
    std::shared_future<ClassificationPtr> pending;
    bool owner = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        // Someone may have published it while we waited for the lock.
        auto it = entries.find(path);
        if (it != entries.end() && it->second->fingerprint == fingerprint) {
            return it->second;
        }
        auto flight = in_flight.find(fingerprint);
        if (flight != in_flight.end()) {
            pending = flight->second;
        }
        else {
            pending = promise.get_future().share();
            in_flight.emplace(fingerprint, pending);
            owner = true;
        }
    }

    if (!owner) {
        ClassificationPtr shared = pending.get();
        std::unique_lock<std::shared_mutex> lock(mutex);
        entries[path] = shared;
        return shared;
    }

    ClassificationPtr result;
    try {
        result = LineClassifier::classify(buffer);
    }
    catch (...) {
        promise.set_exception(std::current_exception());
        std::unique_lock<std::shared_mutex> lock(mutex);
        in_flight.erase(fingerprint);
        throw;
    }
    classifications++;
    TextIO::debug("DAP Info: Classified " + path + " (" + std::to_string(result->line_count()) + " lines)\n");

    promise.set_value(result);
    std::unique_lock<std::shared_mutex> lock(mutex);
    entries[path] = result;
    in_flight.erase(fingerprint);
    return result;
}

ClassificationPtr SourceIndexCache::lookup(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = entries.find(path);
    return it == entries.end() ? nullptr : it->second;
}

void SourceIndexCache::invalidate(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    entries.erase(path);
}

void SourceIndexCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    entries.clear();
}

size_t SourceIndexCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return entries.size();
}
