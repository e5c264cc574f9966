/**
 * @file remote_project.h
 * @brief Main header for the remote_project library
 * @version 0.1.0
 *
 * Include this header to access the remote project client.
 *
 * @code
 * #include <cavesync/remote_project/remote_project.h>
 *
 * using namespace cavesync::remote_project;
 *
 * auto client = remote_project_client::builder()
 *     .with_config(client_config::from_environment())
 *     .build();
 * @endcode
 */

#ifndef CAVESYNC_REMOTE_PROJECT_REMOTE_PROJECT_H
#define CAVESYNC_REMOTE_PROJECT_REMOTE_PROJECT_H

#include <cstdint>
#include <string>

// Core types
#include "cavesync/remote_project/core/types.h"
#include "cavesync/remote_project/core/project_types.h"
#include "cavesync/remote_project/core/checksum.h"
#include "cavesync/remote_project/core/cancellation.h"

// Client
#include "cavesync/remote_project/client/client_types.h"
#include "cavesync/remote_project/client/remote_project_client.h"

// Adapters
#include "cavesync/remote_project/adapters/thread_pool_adapter.h"

namespace cavesync::remote_project {

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

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_REMOTE_PROJECT_H
