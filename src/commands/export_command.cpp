// =============================================================================
// cadvc - Export Command Implementation
// =============================================================================

#include "export_command.h"

#include <iostream>

#include <fmt/format.h>

#include "cadvc/common/config.h"
#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/transform/archive_transformer.h"
#include "command_support.h"

namespace cadvc::commands {

ExportCommand::ExportCommand(ExportOptions options) : options_(std::move(options)) {}

int ExportCommand::execute() {
    try {
        const RepositoryConfig config = loadConfig(options_.repoRoot);
        transform::ArchiveTransformer transformer(config, options_.repoRoot);

        auto result = transformer.exportArchive(options_.archivePath, options_.treeRoot);
        if (!result) {
            return reportError(result.error(), "Export");
        }

        std::cout << fmt::format("Exported {} -> {}\n", options_.archivePath.filename().string(),
                                 result->treeRoot.string());
        std::cout << fmt::format("  Members:          {}\n", result->memberCount);
        if (result->relocatedCount > 0) {
            std::cout << fmt::format("  Extensionless:    {}\n", result->relocatedCount);
        }
        if (result->chunkCount > 0) {
            std::cout << fmt::format("  Chunked files:    {} in {} archive(s)\n",
                                     result->chunkedCount, result->chunkCount);
        }
        return 0;

    } catch (const CadvcException& e) {
        CADVC_LOG_ERROR("Export failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        CADVC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternal);
    }
}

std::unique_ptr<ExportCommand> createExportCommand(const std::string& archivePath,
                                                   const std::string& treeRoot,
                                                   const std::filesystem::path& repoRoot) {
    ExportOptions opts;
    opts.archivePath = resolveUserPath(archivePath);
    if (!treeRoot.empty()) {
        opts.treeRoot = resolveUserPath(treeRoot);
    }
    opts.repoRoot = repoRoot;
    return std::make_unique<ExportCommand>(std::move(opts));
}

}  // namespace cadvc::commands
