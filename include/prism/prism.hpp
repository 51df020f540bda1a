#pragma once

/**
 * @file prism.hpp
 * @brief Umbrella header for the Prism simulation orchestrator
 *
 * Include this header to get access to all public Prism APIs.
 */

// Core
#include <prism/core/CoreTypes.hpp>
#include <prism/core/Error.hpp>
#include <prism/core/ErrorLogging.hpp>
#include <prism/core/Params.hpp>
#include <prism/core/Results.hpp>

// Process execution
#include <prism/exec/ArgumentSanitizer.hpp>
#include <prism/exec/ProcessRunner.hpp>

// Cache
#include <prism/cache/CacheKey.hpp>
#include <prism/cache/CacheStore.hpp>
#include <prism/cache/LruTtlStore.hpp>
#include <prism/cache/ResultCache.hpp>

// I/O
#include <prism/io/Config.hpp>
#include <prism/io/ConfigLoader.hpp>
#include <prism/io/LogService.hpp>
#include <prism/io/LogSetup.hpp>
#include <prism/io/ResultStore.hpp>

// Service
#include <prism/service/EvaluationService.hpp>
#include <prism/service/Executor.hpp>
#include <prism/service/ExperimentTracker.hpp>
#include <prism/service/Metrics.hpp>
#include <prism/service/OperationRegistry.hpp>
#include <prism/service/Orchestrator.hpp>
#include <prism/service/SweepExecutor.hpp>

// Optimization
#include <prism/opt/Bridge.hpp>
#include <prism/opt/GaussianProcessStrategy.hpp>
#include <prism/opt/OptimizationDriver.hpp>
#include <prism/opt/OptimizationRun.hpp>
#include <prism/opt/ParameterSpace.hpp>
#include <prism/opt/SearchStrategy.hpp>
