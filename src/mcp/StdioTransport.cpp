// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <format>

namespace mcprunner
{

namespace
{
    constexpr auto ReadPollInterval = std::chrono::milliseconds { 100 };
} // namespace

struct StdioTransport::Impl
{
    std::unique_ptr<Process> process;
    StdioTransportOptions options;
    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;
    std::string readBuffer;
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const ServerConfig& config, const StdioTransportOptions& options) -> VoidResult
{
    if (_impl->process)
        return makeError(ErrorCode::TransportError, "Transport already started");

    auto process = Process::launch(config, options.launch);
    if (!process)
        return std::unexpected(process.error());

    _impl->process = std::move(*process);
    _impl->options = options;
    _impl->connected = true;
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->process)
        return makeError(ErrorCode::TransportError, "Transport not connected");
    if (!_impl->connected)
        return makeError(ErrorCode::ConnectionClosed, "Transport closed");

    log::trace("[{}] --> {}", _impl->process->name(), message.dump());
    return _impl->process->write(message.dump() + "\n");
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->process)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            log::trace("[{}] <-- {}", _impl->process->name(), line);
            return json::parse(line);
        }

        if (_impl->closing)
            return makeError(ErrorCode::ConnectionClosed, "Transport closed");

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = _impl->process->read(buf, ReadPollInterval);
        if (!bytesRead)
        {
            _impl->connected = false;
            return std::unexpected(bytesRead.error());
        }
        _impl->readBuffer.append(buf.data(), *bytesRead);
    }
}

void StdioTransport::close()
{
    if (!_impl->process || _impl->closing.exchange(true))
        return;

    _impl->connected = false;
    _impl->process->terminate(_impl->options.terminateGrace);
    log::debug("MCP transport closed: {}", _impl->process->name());
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace mcprunner
