#include "process/PipeExecutor.hpp"
#include "process/BinaryLocator.hpp"
#include "process/ChildProcess.hpp"
#include <spdlog/spdlog.h>

std::optional<std::string> PipeExecutor::locate(const std::string& binary) const {
    return BinaryLocator::which(binary);
}

CliResult PipeExecutor::execute(const std::string& binary, const ExecOptions& options) {
    auto path = locate(binary);
    if (!path) {
        throw ProcessError(ProcessError::Kind::BinaryNotFound,
                           "CLI not found: " + binary);
    }

    ChildProcess::LaunchSpec spec;
    spec.path = *path;
    spec.argv.push_back(*path);
    spec.argv.insert(spec.argv.end(), options.args.begin(), options.args.end());
    spec.env = ChildProcess::buildEnvironment(environmentExclusions_, {"NO_COLOR=1"});
    spec.workingDirectory = options.workingDirectory;

    spdlog::info("Running {} via pipes ({} args, timeout {}ms)",
                 binary, options.args.size(), options.timeout.count());

    auto child = ChildProcess::spawnPipes(spec);
    ExecOptions run = options;
    if (!run.cancel) run.cancel = cancel_;
    return child.interact(run);
}
