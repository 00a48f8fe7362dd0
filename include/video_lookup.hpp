#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <boost/json.hpp>

#include "cache_store.hpp"

namespace streamguard {

namespace json = boost::json;

// Failure of the video metadata collaborator. The message is internal and
// never reaches a client unredacted.
class LookupError : public std::runtime_error {
public:
    enum class Kind {
        Unavailable,    // extractor failed or exited non-zero
        Timeout,
        InvalidOutput   // extractor output could not be parsed
    };

    LookupError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Resolves video, playlist and stream information for validated input.
class VideoLookup {
public:
    virtual ~VideoLookup() = default;

    virtual json::object get_video_info(const std::string& platform, const std::string& video_id) = 0;
    virtual json::object get_playlist_info(const std::string& platform, const std::string& playlist_id) = 0;
    virtual std::string get_stream_url(const std::string& platform, const std::string& video_id,
                                       const std::string& quality) = 0;

    // Reported by the health endpoint.
    virtual bool is_healthy() { return true; }
};

// Runs an external program and returns its standard output.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @param argv argv[0] is the program; no shell is involved.
     * @throws LookupError on spawn failure, non-zero exit, or timeout.
     */
    virtual std::string run(const std::vector<std::string>& argv, std::chrono::seconds timeout) = 0;
};

// Boost.Process implementation. Standard error is discarded.
class ProcessCommandRunner : public CommandRunner {
public:
    std::string run(const std::vector<std::string>& argv, std::chrono::seconds timeout) override;
};

// Canonical page URL for a platform identifier.
std::string build_video_url(const std::string& platform, const std::string& video_id);

// Extractor format selector for a quality label.
std::string format_selector(const std::string& quality);

// First non-empty line of extractor output. Throws LookupError when none.
std::string first_stream_url(const std::string& output);

/**
 * Metadata lookup backed by the yt-dlp command-line extractor. The platform
 * and identifier have already passed validation, so they are safe to place
 * in argv.
 */
class ExtractorVideoLookup : public VideoLookup {
public:
    ExtractorVideoLookup(std::string extractor_path, std::chrono::seconds timeout,
                         std::unique_ptr<CommandRunner> runner = std::make_unique<ProcessCommandRunner>());

    json::object get_video_info(const std::string& platform, const std::string& video_id) override;
    json::object get_playlist_info(const std::string& platform, const std::string& playlist_id) override;
    std::string get_stream_url(const std::string& platform, const std::string& video_id,
                               const std::string& quality) override;

private:
    std::string extractor_path_;
    std::chrono::seconds timeout_;
    std::unique_ptr<CommandRunner> runner_;

    json::object run_json(const std::vector<std::string>& args);
};

/**
 * Read-through cache in front of another lookup. Entries live under
 * video:, playlist: and stream: keys with the configured TTLs. Cache
 * failures are logged and the call falls through to the inner lookup.
 */
class CachedVideoLookup : public VideoLookup {
public:
    CachedVideoLookup(std::unique_ptr<VideoLookup> inner, std::shared_ptr<CacheStore> cache,
                      std::chrono::seconds info_ttl, std::chrono::seconds stream_ttl);

    json::object get_video_info(const std::string& platform, const std::string& video_id) override;
    json::object get_playlist_info(const std::string& platform, const std::string& playlist_id) override;
    std::string get_stream_url(const std::string& platform, const std::string& video_id,
                               const std::string& quality) override;
    bool is_healthy() override;

private:
    std::unique_ptr<VideoLookup> inner_;
    std::shared_ptr<CacheStore> cache_;
    std::chrono::seconds info_ttl_;
    std::chrono::seconds stream_ttl_;

    std::optional<std::string> cache_get(const std::string& key);
    void cache_set(const std::string& key, const std::string& value, std::chrono::seconds ttl);
};

}
