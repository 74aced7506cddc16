/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cuvette_engine_ExecutionEngine_hpp
#define cuvette_engine_ExecutionEngine_hpp

#include <chrono>
#include <memory>

#include "common/Config.hpp"
#include "engine/CodeTransformer.hpp"
#include "engine/ContainerExecutor.hpp"
#include "engine/EnvironmentProvisioner.hpp"
#include "engine/ExecutionTypes.hpp"
#include "engine/FileResolver.hpp"
#include "engine/OutputReconciler.hpp"
#include "engine/RequestValidator.hpp"
#include "engine/RunLogger.hpp"
#include "engine/StagingContext.hpp"


namespace cuvette {
namespace engine {

/**
 * Runs one request through the whole pipeline: validation, provisioning of the
 * staging directories, resolution of the data files, transformation of the code,
 * execution in a container and reconciliation of the created files.
 *
 * The engine holds no per-invocation state, so one instance can serve concurrent
 * calls to execute().
 */
class ExecutionEngine {
public:
    ExecutionEngine(std::shared_ptr<const common::Config>);

    ExecutionResult execute(const ExecutionRequest&) const;

private:
    ExecutionResult runPipeline(const ExecutionRequest&,
                                const StagingContext&,
                                RunLogger&,
                                std::chrono::steady_clock::time_point start) const;
    void writeScript(const std::string& code, const StagingContext&) const;
    void cleanup(StagingContext&, RunLogger&) const;

private:
    std::shared_ptr<const common::Config> config;
    RequestValidator validator;
    EnvironmentProvisioner provisioner;
    FileResolver resolver;
    CodeTransformer transformer;
    ContainerExecutor executor;
    OutputReconciler reconciler;
};

}
}

#endif
