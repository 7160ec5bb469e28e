// SourceIndexCache.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "Types.hpp"

class SourceBuffer;

// Where sessions get line classifications from. Injected into every
// DebugSession so tests can substitute their own.
class SourceIndex {
public:
    virtual ~SourceIndex() = default;

    // Cached classification if the fingerprint matches, otherwise a fresh one
    // that replaces the old entry for this path.
    virtual ClassificationPtr get_or_build(const SourceBuffer& buffer) = 0;

    // Whatever is cached for the path right now, or nullptr.
    virtual ClassificationPtr lookup(const std::string& path) const = 0;

    virtual void invalidate(const std::string& path) = 0;
};

// Process-wide cache shared by all sessions. Reads take a shared lock; a miss
// takes the exclusive lock only to publish. Concurrent misses on the same
// fingerprint wait on one in-flight classification instead of repeating it.
class SourceIndexCache : public SourceIndex {
public:
    ClassificationPtr get_or_build(const SourceBuffer& buffer) override;
    ClassificationPtr lookup(const std::string& path) const override;
    void invalidate(const std::string& path) override;

    void clear();
    size_t size() const;

    // Number of times the classifier actually ran.
    uint64_t classify_count() const { return classifications.load(); }

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, ClassificationPtr> entries;
    std::unordered_map<uint64_t, std::shared_future<ClassificationPtr>> in_flight;
    std::atomic<uint64_t> classifications{ 0 };
};
