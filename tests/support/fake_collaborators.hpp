#pragma once

#include <mediafetch/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mediafetch::test_support {

inline ByteVector bytesOf(const std::string& s) {
    ByteVector out(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
        out[i] = static_cast<std::byte>(s[i]);
    return out;
}

inline std::string stringOf(const ByteVector& v) {
    std::string out(v.size(), '\0');
    for (std::size_t i = 0; i < v.size(); ++i)
        out[i] = static_cast<char>(v[i]);
    return out;
}

// Splits `payload` into chunks of `chunkSize` served from "mem://chunk/<i>".
inline downloader::Manifest splitIntoManifest(const std::string& payload, std::size_t chunkSize) {
    downloader::Manifest m;
    std::uint32_t index = 0;
    for (std::size_t off = 0; off < payload.size(); off += chunkSize, ++index) {
        downloader::ChunkDescriptor c;
        c.index = index;
        c.range.offset = off;
        c.range.length = std::min(chunkSize, payload.size() - off);
        c.locator.url = "mem://chunk/" + std::to_string(index);
        m.chunks.push_back(c);
    }
    m.totalSize = payload.size();
    return m;
}

/**
 * In-memory transport. Serves bodies by URL; scripted errors are consumed per URL before the
 * body is served. An optional gate blocks a URL until released or cancelled.
 */
class FakeTransport final : public downloader::IChunkTransport {
public:
    void serve(const std::string& url, ByteVector body) {
        std::lock_guard<std::mutex> lk(mutex_);
        bodies_[url] = std::move(body);
    }

    void serveManifest(const downloader::Manifest& m, const std::string& payload) {
        for (const auto& c : m.chunks) {
            serve(c.locator.url, bytesOf(payload.substr(static_cast<std::size_t>(c.range.offset),
                                                        static_cast<std::size_t>(c.range.length))));
        }
    }

    void failNext(const std::string& url, ErrorCode code, int times = 1) {
        std::lock_guard<std::mutex> lk(mutex_);
        for (int i = 0; i < times; ++i)
            failures_[url].push_back(code);
    }

    void gate(const std::string& url) {
        std::lock_guard<std::mutex> lk(mutex_);
        gated_[url] = true;
    }

    void release(const std::string& url) {
        std::lock_guard<std::mutex> lk(mutex_);
        gated_[url] = false;
    }

    int callsFor(const std::string& url) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    int totalCalls() const { return total_.load(); }

    // Number of fetches currently parked on a gate.
    int blocked() const { return blocked_.load(); }

    Result<ByteVector> fetch(const downloader::ChunkLocator& locator, const downloader::ByteRange&,
                             std::chrono::milliseconds,
                             const downloader::ShouldCancel& shouldCancel) override {
        total_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            calls_[locator.url]++;
        }

        bool counted = false;
        for (;;) {
            {
                std::lock_guard<std::mutex> lk(mutex_);
                auto it = gated_.find(locator.url);
                if (it == gated_.end() || !it->second)
                    break;
            }
            if (shouldCancel && shouldCancel()) {
                if (counted)
                    blocked_.fetch_sub(1);
                return Error{ErrorCode::OperationCancelled, "cancelled while gated"};
            }
            if (!counted) {
                blocked_.fetch_add(1);
                counted = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        if (counted)
            blocked_.fetch_sub(1);

        std::lock_guard<std::mutex> lk(mutex_);
        auto f = failures_.find(locator.url);
        if (f != failures_.end() && !f->second.empty()) {
            auto code = f->second.front();
            f->second.pop_front();
            return Error{code, "scripted failure for " + locator.url};
        }
        auto b = bodies_.find(locator.url);
        if (b == bodies_.end())
            return Error{ErrorCode::NotFound, "no body for " + locator.url};
        return b->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ByteVector> bodies_;
    std::map<std::string, std::deque<ErrorCode>> failures_;
    std::map<std::string, bool> gated_;
    std::map<std::string, int> calls_;
    std::atomic<int> total_{0};
    std::atomic<int> blocked_{0};
};

// Borrows a transport owned by the test so it can be handed to a service as a unique_ptr.
class TransportRef final : public downloader::IChunkTransport {
public:
    explicit TransportRef(downloader::IChunkTransport& inner) : inner_(inner) {}

    Result<ByteVector> fetch(const downloader::ChunkLocator& locator,
                             const downloader::ByteRange& range, std::chrono::milliseconds timeout,
                             const downloader::ShouldCancel& shouldCancel) override {
        return inner_.fetch(locator, range, timeout, shouldCancel);
    }

private:
    downloader::IChunkTransport& inner_;
};

// Serves a fixed manifest and counts calls.
class FixedResolver final : public downloader::IManifestResolver {
public:
    explicit FixedResolver(downloader::Manifest manifest) : manifest_(std::move(manifest)) {}

    Result<downloader::Manifest> resolve(const Item&) override {
        calls_.fetch_add(1);
        return manifest_;
    }

    int calls() const { return calls_.load(); }

private:
    downloader::Manifest manifest_;
    std::atomic<int> calls_{0};
};

} // namespace mediafetch::test_support
