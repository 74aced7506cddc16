/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ExecutionEngine.hpp"

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libcuvette/Error.hpp"
#include "libcuvette/Utility.hpp"
#include "engine/Errors.hpp"
#include "engine/Utility.hpp"


namespace cuvette {
namespace engine {

ExecutionEngine::ExecutionEngine(std::shared_ptr<const common::Config> config)
    : config{config}
    , validator{config}
    , provisioner{config}
    , resolver{config}
    , executor{config}
    , reconciler{config}
{}

ExecutionResult ExecutionEngine::execute(const ExecutionRequest& request) const {
    auto start = std::chrono::steady_clock::now();
    utility::logMessage("Executing request", libcuvette::LogLevel::INFO);

    validator.validate(request);

    RunLogger runLogger{ config->json["logsDir"].GetString() };
    runLogger.log(RunLogger::Stage::PROVISIONING, boost::format("Execution started (%d bytes of code, %d data file(s))")
                                                   % request.code.size() % request.dataFiles.size());

    auto context = boost::optional<StagingContext>{};
    try {
        context.emplace(provisioner.createStagingContext());
        runLogger.log(RunLogger::Stage::PROVISIONING, boost::format("Created staging directories in %s")
                                                       % context->getRunRoot());

        auto result = runPipeline(request, *context, runLogger, start);

        cleanup(*context, runLogger);
        runLogger.log(RunLogger::Stage::CLEANUP, boost::format("Execution succeeded in %.3f seconds")
                                                  % result.elapsedSeconds);
        runLogger.close();
        return result;
    }
    catch(std::exception& e) {
        runLogger.log(RunLogger::Stage::CLEANUP, boost::format("Execution failed (%s): %s")
                                                  % libcuvette::getExceptionTypeString(e) % e.what());
        if(context) {
            cleanup(*context, runLogger);
        }
        runLogger.close();
        CUVETTE_RETHROW_ERROR(e, "Failed to execute request");
    }
}

ExecutionResult ExecutionEngine::runPipeline(const ExecutionRequest& request,
                                             const StagingContext& context,
                                             RunLogger& runLogger,
                                             std::chrono::steady_clock::time_point start) const {
    auto limits = provisioner.makeResourceLimits(request);
    auto environment = provisioner.makeGuestEnvironment();
    auto guestPaths = provisioner.getGuestPaths();
    runLogger.log(RunLogger::Stage::PROVISIONING,
                  boost::format("Resource limits: memory=%d bytes, cpus=%g, pids=%d, timeout=%d s, output=%d bytes")
                    % limits.memoryBytes % limits.cpus % limits.pidsLimit % limits.timeout.count() % limits.maxOutputBytes);

    auto files = resolver.stageFiles(request.dataFiles, context);
    for(const auto& file : files) {
        runLogger.log(RunLogger::Stage::RESOLUTION, boost::format("Staged '%s' (%s, %s) from '%s' as %s")
                                                     % file.logicalName % file.originalFilename
                                                     % fileTypeToString(file.type) % file.handle % file.guestPath);
    }
    resolver.writeManifest(files, context);
    auto prelude = resolver.makePrelude();
    runLogger.log(RunLogger::Stage::RESOLUTION, boost::format("Resolved %d data file(s)") % files.size());

    auto code = transformer.transform(request.code, prelude);
    writeScript(code, context);
    runLogger.log(RunLogger::Stage::TRANSFORMATION, boost::format("Transformed code:\n%s") % code);

    executor.checkAvailability();

    auto before = OutputSnapshot{};
    try {
        before = reconciler.snapshot(context.getOutputRoot());
    }
    catch(const libcuvette::Error& e) {
        CUVETTE_THROW_TYPED_ERROR(SetupError, e.what());
    }

    auto containerName = ContainerExecutor::makeContainerName();
    auto args = executor.makeRunArguments(containerName, context, limits, environment, guestPaths);
    auto outcome = executor.run(args, containerName, ContainerExecutor::getContainerIdFile(context), limits, runLogger);

    auto result = ExecutionResult{};
    result.output = outcome.combinedText;
    result.stdoutText = outcome.stdoutText;
    result.stderrText = outcome.stderrText;
    result.executedCode = code;
    result.exitCode = outcome.exitCode;

    try {
        auto reconciled = reconciler.reconcile(context.getOutputRoot(), before, code);
        result.createdFiles = std::move(reconciled.createdFiles);
        result.binaryOutput = std::move(reconciled.primaryOutput);
        runLogger.log(RunLogger::Stage::RECONCILIATION, boost::format("Found %d created file(s), primary output: %s")
                                                         % result.createdFiles.size()
                                                         % (result.binaryOutput ? result.binaryOutput->filename : "none"));
    }
    catch(const ReconciliationError& e) {
        utility::logMessage(boost::format("Reconciliation of created files failed, returning text output only: %s") % e.what(),
                            libcuvette::LogLevel::WARN);
        runLogger.log(RunLogger::Stage::RECONCILIATION, boost::format("Reconciliation failed: %s") % e.what());
        result.createdFiles.clear();
        result.binaryOutput = boost::none;
    }

    result.kind = result.binaryOutput ? ResultKind::BINARY_ARTIFACT : ResultKind::TEXT;
    result.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

void ExecutionEngine::writeScript(const std::string& code, const StagingContext& context) const {
    auto script = context.getScriptRoot() / ContainerExecutor::scriptFilename;
    try {
        libcuvette::filesystem::writeTextFile(code, script);
        namespace fs = boost::filesystem;
        fs::permissions(script, fs::owner_read | fs::owner_write | fs::group_read | fs::others_read);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write script %s: %s") % script % e.what();
        CUVETTE_THROW_TYPED_ERROR(SetupError, message.str());
    }
}

/**
 * Removes the staging directories. A failure here is logged and otherwise
 * ignored: it must not hide the outcome of the execution.
 */
void ExecutionEngine::cleanup(StagingContext& context, RunLogger& runLogger) const {
    try {
        context.remove();
        runLogger.log(RunLogger::Stage::CLEANUP, boost::format("Removed staging directories %s") % context.getRunRoot());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to remove staging directories %s: %s") % context.getRunRoot() % e.what();
        utility::logMessage(message, libcuvette::LogLevel::WARN);
        runLogger.log(RunLogger::Stage::CLEANUP, message);
    }
}

}
}
