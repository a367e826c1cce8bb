#include "process/PtyExecutor.hpp"
#include "process/BinaryLocator.hpp"
#include "process/ChildProcess.hpp"
#include <spdlog/spdlog.h>

PtyExecutor::PtyExecutor(std::vector<std::string> environmentExclusions,
                         unsigned short columns, unsigned short rows)
    : environmentExclusions_(std::move(environmentExclusions)),
      columns_(columns), rows_(rows) {}

std::optional<std::string> PtyExecutor::locate(const std::string& binary) const {
    return BinaryLocator::which(binary);
}

CliResult PtyExecutor::execute(const std::string& binary, const ExecOptions& options) {
    auto path = locate(binary);
    if (!path) {
        throw ProcessError(ProcessError::Kind::BinaryNotFound,
                           "CLI not found: " + binary);
    }

    ChildProcess::LaunchSpec spec;
    spec.path = *path;
    spec.argv.push_back(*path);
    spec.argv.insert(spec.argv.end(), options.args.begin(), options.args.end());
    spec.env = ChildProcess::buildEnvironment(
        environmentExclusions_,
        {"TERM=xterm-256color",
         "COLUMNS=" + std::to_string(columns_),
         "LINES=" + std::to_string(rows_)});
    spec.workingDirectory = options.workingDirectory;

    spdlog::info("Running {} via pty ({} args, timeout {}ms)",
                 binary, options.args.size(), options.timeout.count());

    auto child = ChildProcess::spawnPty(spec, columns_, rows_);
    ExecOptions run = options;
    if (!run.cancel) run.cancel = cancel_;
    auto result = child.interact(run);

    spdlog::debug("{} finished: exit={} quiesced={} bytes={}",
                  binary, result.exitCode, result.quiesced, result.output.size());
    return result;
}
