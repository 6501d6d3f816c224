// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <api/RequestHandler.hpp>
#include <core/Log.hpp>
#include <session/CleanupScheduler.hpp>
#include <session/SessionManager.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <format>
#include <iostream>
#include <list>
#include <mutex>
#include <string>
#include <thread>

#ifndef _WIN32
    #include <unistd.h>
#endif

namespace mcprunner
{

namespace
{
    std::atomic<bool> shutdownSignalled = false;

    void onShutdownSignal(int /*signal*/)
    {
        shutdownSignalled = true;
#ifndef _WIN32
        // Unblocks the request reader, which then shuts down as on end of input.
        ::close(STDIN_FILENO);
#endif
    }

    struct Worker
    {
        std::shared_ptr<std::atomic<bool>> done = std::make_shared<std::atomic<bool>>(false);
        std::jthread thread;
    };
} // namespace

struct App::Impl
{
    RunnerConfig config;
    std::unique_ptr<SessionManager> manager;
    std::unique_ptr<CleanupScheduler> scheduler;
    std::unique_ptr<RequestHandler> handler;
    bool shutDown = false;

    std::mutex outputMutex;

    std::mutex workerMutex;
    std::condition_variable workerFinished;
    size_t runningWorkers = 0;

    /// Blocks until fewer than the configured number of requests are being handled.
    void acquireWorkerSlot()
    {
        auto const limit = static_cast<size_t>(config.session.maxConcurrentRequests);
        auto lock = std::unique_lock(workerMutex);
        if (runningWorkers >= limit)
            log::debug("{} request(s) in flight, waiting for a free worker", runningWorkers);
        workerFinished.wait(lock, [&] { return runningWorkers < limit; });
        ++runningWorkers;
    }

    void releaseWorkerSlot()
    {
        {
            auto lock = std::lock_guard(workerMutex);
            --runningWorkers;
        }
        workerFinished.notify_one();
    }

    void writeResponse(std::ostream& output, const nlohmann::json& response)
    {
        auto const line = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        auto lock = std::lock_guard(outputMutex);
        output << line << '\n';
        output.flush();
    }
};

App::App(RunnerConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App()
{
    shutdown();
}

auto App::initialize() -> VoidResult
{
    auto const& config = _impl->config;

    if (auto valid = validateConfig(config); !valid)
        return valid;

    if (auto level = log::parseLevel(config.log.level))
        log::setLevel(*level);
    if (!config.log.file.empty())
    {
        if (auto opened = log::openLogFile(config.log.file); !opened)
            return opened;
    }

    _impl->manager = std::make_unique<SessionManager>(sessionManagerOptions(config));
    _impl->handler = std::make_unique<RequestHandler>(*_impl->manager, config);

    if (config.session.autoCleanup)
    {
        _impl->scheduler = std::make_unique<CleanupScheduler>(
            *_impl->manager, std::chrono::seconds { config.session.cleanupIntervalSeconds });
        _impl->scheduler->start();
        log::info("Periodic session cleanup started (every {}s, idle timeout {}s)",
                  config.session.cleanupIntervalSeconds,
                  config.session.idleTimeoutSeconds);
    }

    log::info("mcp-runner {} ready ({} server preset(s), cache {})",
              RunnerVersion,
              config.mcpServers.size(),
              config.session.cacheEnabled ? "enabled" : "disabled");
    return {};
}

auto App::run() -> int
{
    std::signal(SIGINT, onShutdownSignal);
    std::signal(SIGTERM, onShutdownSignal);

    serve(std::cin, std::cout);

    if (shutdownSignalled)
        log::info("Shutdown requested by signal");
    shutdown();
    return 0;
}

void App::serve(std::istream& input, std::ostream& output)
{
    auto workers = std::list<Worker> {};

    auto line = std::string {};
    while (std::getline(input, line))
    {
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        _impl->acquireWorkerSlot();

        // Finished workers are joined as they are erased.
        workers.remove_if([](const Worker& worker) { return worker.done->load(); });

        auto& worker = workers.emplace_back();
        worker.thread = std::jthread([this, &output, request = line, done = worker.done] {
            auto const response = _impl->handler->handleLine(request);
            _impl->writeResponse(output, response);
            *done = true;
            _impl->releaseWorkerSlot();
        });
    }

    log::debug("End of input, waiting for {} request(s) in flight", workers.size());
    workers.clear();
}

void App::shutdown()
{
    if (_impl->shutDown)
        return;
    _impl->shutDown = true;

    if (_impl->scheduler)
        _impl->scheduler->stop();
    if (_impl->manager)
        _impl->manager->shutdown();
    log::info("mcp-runner shut down");
}

} // namespace mcprunner
