/**
 * @file media_fetch.h
 * @brief Main header for the media_fetch library
 * @version 0.1.0
 *
 * Include this header to access the transfer engine, the library placement
 * stages and the run orchestration.
 *
 * @code
 * #include <kcenon/media_fetch/media_fetch.h>
 *
 * using namespace kcenon::media_fetch;
 *
 * auto config = app_config::load("/etc/media_fetch");
 * auto store = media_pipeline::create_remote_store(config.value().remote);
 * media_pipeline pipeline(config.value(), store.value(),
 *                         std::make_shared<process_tool_runner>());
 * auto summary = pipeline.run();
 * @endcode
 */

#ifndef KCENON_MEDIA_FETCH_MEDIA_FETCH_H
#define KCENON_MEDIA_FETCH_MEDIA_FETCH_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/media_fetch/core/types.h"
#include "kcenon/media_fetch/core/logging.h"

// Remote access
#include "kcenon/media_fetch/remote/remote_store.h"
#include "kcenon/media_fetch/remote/local_remote_store.h"
#include "kcenon/media_fetch/remote/session_limiter.h"
#include "kcenon/media_fetch/remote/sftp_remote_store.h"

// Transfer
#include "kcenon/media_fetch/transfer/chunked_transfer_engine.h"
#include "kcenon/media_fetch/transfer/transfer_scheduler.h"

// Library placement
#include "kcenon/media_fetch/library/episode_classifier.h"
#include "kcenon/media_fetch/library/library_placer.h"

// Subtitles
#include "kcenon/media_fetch/subtitle/ruleset.h"
#include "kcenon/media_fetch/subtitle/subtitle_patch_pipeline.h"
#include "kcenon/media_fetch/subtitle/tool_runner.h"

// Application
#include "kcenon/media_fetch/app/app_config.h"
#include "kcenon/media_fetch/app/instance_lock.h"
#include "kcenon/media_fetch/app/media_pipeline.h"

namespace kcenon::media_fetch {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_MEDIA_FETCH_H
