#pragma once

#include "mx/archive/client.hpp"
#include "mx/cli/options.hpp"
#include "mx/core/cancellation.hpp"

#include <ostream>

namespace mx::cli {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

/**
 * @brief Discover, upload and report one batch
 *
 * Outcome lines go to out/err through the reporter. Returns kExitFailure
 * for an invalid input path or when no video file was found, kExitOk
 * otherwise, however many individual uploads failed.
 */
int run(const Options& options,
        archive::ProtocolClient& client,
        std::ostream& out,
        std::ostream& err,
        CancellationToken* cancellation = nullptr);

} // namespace mx::cli
