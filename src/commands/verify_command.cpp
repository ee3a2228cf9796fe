// =============================================================================
// cadvc - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <iostream>

#include <fmt/format.h>

#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/format/archive_digest.h"
#include "command_support.h"

namespace cadvc::commands {

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

int VerifyCommand::execute() {
    try {
        const auto left = format::digestArchive(options_.leftPath);
        const auto right = format::digestArchive(options_.rightPath);
        const auto diff = format::compareDigests(left, right);

        if (diff.equal()) {
            std::cout << fmt::format("Identical: {} members, digest {:016x}\n",
                                     left.members.size(), left.combined);
            return 0;
        }

        std::cout << fmt::format("Different: {} only in {}, {} only in {}, {} changed\n",
                                 diff.onlyInLeft.size(), options_.leftPath.filename().string(),
                                 diff.onlyInRight.size(), options_.rightPath.filename().string(),
                                 diff.differing.size());
        if (options_.verbose) {
            for (const auto& name : diff.onlyInLeft) {
                std::cout << "  - " << name << '\n';
            }
            for (const auto& name : diff.onlyInRight) {
                std::cout << "  + " << name << '\n';
            }
            for (const auto& name : diff.differing) {
                std::cout << "  * " << name << '\n';
            }
        }
        return kExitContentDiffers;

    } catch (const CadvcException& e) {
        CADVC_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        CADVC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternal);
    }
}

std::unique_ptr<VerifyCommand> createVerifyCommand(const std::string& leftPath,
                                                   const std::string& rightPath, bool verbose) {
    VerifyOptions opts;
    opts.leftPath = resolveUserPath(leftPath);
    opts.rightPath = resolveUserPath(rightPath);
    opts.verbose = verbose;
    return std::make_unique<VerifyCommand>(std::move(opts));
}

}  // namespace cadvc::commands
