// =============================================================================
// cadvc - Import Command Implementation
// =============================================================================

#include "import_command.h"

#include <iostream>

#include <fmt/format.h>

#include "cadvc/common/config.h"
#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/transform/archive_transformer.h"
#include "command_support.h"

namespace cadvc::commands {

ImportCommand::ImportCommand(ImportOptions options) : options_(std::move(options)) {}

int ImportCommand::execute() {
    try {
        const RepositoryConfig config = loadConfig(options_.repoRoot);
        transform::ArchiveTransformer transformer(config, options_.repoRoot);

        auto result = transformer.importArchive(options_.treeRoot, options_.archivePath);
        if (!result) {
            return reportError(result.error(), "Import");
        }

        std::cout << fmt::format("Imported {} -> {}\n", options_.treeRoot.string(),
                                 result->archive.string());
        std::cout << fmt::format("  Members:          {}\n", result->memberCount);
        if (result->unchunkedCount > 0) {
            std::cout << fmt::format("  Restored chunks:  {} file(s)\n", result->unchunkedCount);
        }
        return 0;

    } catch (const CadvcException& e) {
        CADVC_LOG_ERROR("Import failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        CADVC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternal);
    }
}

std::unique_ptr<ImportCommand> createImportCommand(const std::string& treeRoot,
                                                   const std::string& archivePath,
                                                   const std::filesystem::path& repoRoot) {
    ImportOptions opts;
    opts.treeRoot = resolveUserPath(treeRoot);
    opts.archivePath = resolveUserPath(archivePath);
    opts.repoRoot = repoRoot;
    return std::make_unique<ImportCommand>(std::move(opts));
}

}  // namespace cadvc::commands
