/**
 * @file object_transfer.h
 * @brief Main header for object_trans_system library
 * @version 0.1.0
 *
 * This is the primary include file for the object_trans_system library.
 * Include this header to access the transfer engine and its building blocks.
 *
 * @code
 * #include <kcenon/object_transfer/object_transfer.h>
 *
 * using namespace kcenon::object_transfer;
 *
 * auto engine = transfer_engine::builder()
 *     .with_s3_store(s3_store_config_builder().with_environment_credentials().build())
 *     .build();
 * @endcode
 */

#ifndef KCENON_OBJECT_TRANSFER_OBJECT_TRANSFER_H
#define KCENON_OBJECT_TRANSFER_OBJECT_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/object_transfer/core/types.h"
#include "kcenon/object_transfer/core/error_codes.h"
#include "kcenon/object_transfer/core/object_url.h"
#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/core/cancellation.h"
#include "kcenon/object_transfer/core/logging.h"

// Configuration
#include "kcenon/object_transfer/config/engine_config.h"

// Pipeline stages
#include "kcenon/object_transfer/descriptor/descriptor_builder.h"
#include "kcenon/object_transfer/mode/mode_selector.h"
#include "kcenon/object_transfer/mode/capability_probe.h"
#include "kcenon/object_transfer/command/batch_command_generator.h"
#include "kcenon/object_transfer/execution/transfer_executor.h"
#include "kcenon/object_transfer/reporting/efficiency_reporter.h"

// Object stores
#include "kcenon/object_transfer/storage/object_store.h"
#include "kcenon/object_transfer/storage/local_object_store.h"
#include "kcenon/object_transfer/storage/s3_object_store.h"
#include "kcenon/object_transfer/storage/http_source.h"

// Engine
#include "kcenon/object_transfer/engine/transfer_engine.h"

namespace kcenon::object_transfer {

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

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_OBJECT_TRANSFER_H
