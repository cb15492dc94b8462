/**
 * @file rtransfer.h
 * @brief Main header for the rtransfer library
 * @version 1.0.0
 *
 * Include this header to access the transfer engine, its sessions and the
 * bundled collaborator adapters.
 *
 * @code
 * #include <rtransfer/rtransfer.h>
 *
 * using namespace rtransfer;
 *
 * auto engine = transfer_engine::builder().build();
 * auto session = engine.value().create_session(
 *     engine.value().make_request("https://example.com/archive.zip"));
 * (void)session.value()->start();
 * auto outcome = session.value()->wait();
 * @endcode
 */

#ifndef RTRANSFER_RTRANSFER_H
#define RTRANSFER_RTRANSFER_H

#include <string>

// Core types
#include "rtransfer/core/types.h"
#include "rtransfer/core/transfer_types.h"
#include "rtransfer/core/logging.h"
#include "rtransfer/core/progress_tracker.h"
#include "rtransfer/core/url_utils.h"

// Collaborator contracts and adapters
#include "rtransfer/transport/stream_fetcher_interface.h"
#include "rtransfer/transport/reachability_probe.h"
#include "rtransfer/transport/http_stream_fetcher.h"
#include "rtransfer/transport/http_reachability_probe.h"
#include "rtransfer/media/media_source_interface.h"
#include "rtransfer/media/ytdlp_media_source.h"

// Sessions
#include "rtransfer/session/engine_config.h"
#include "rtransfer/session/transfer_session.h"
#include "rtransfer/session/transfer_engine.h"

namespace rtransfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 1;
    static constexpr int minor = 0;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace rtransfer

#endif  // RTRANSFER_RTRANSFER_H
