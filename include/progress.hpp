#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

enum class ProgressPhase
{
    Skip,        // destination already exists, nothing transferred
    Start,       // about to write the first byte
    Restart,     // server ignored Range, partial bytes discarded
    Downloading, // bytes arriving
    Done         // renamed into place
};

const char *phaseName(ProgressPhase phase);

struct ProgressEvent
{
    std::uint64_t bytesTransferred = 0;
    std::optional<std::uint64_t> totalBytes; // nullopt when the server sent no Content-Length
    std::string filename;
    ProgressPhase phase = ProgressPhase::Start;
};

/**
 * Receives progress from the transfer engine.
 * Purely observational: nothing a sink does changes what the engine decides.
 */
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;
    virtual void onProgress(const ProgressEvent &event) = 0;
};

/**
 * Sink that drops everything, for callers that don't care.
 */
class NullProgressSink : public ProgressSink
{
public:
    void onProgress(const ProgressEvent &) override {}
};

// One fresh sink per batch item so progress state never leaks between items
using ProgressSinkFactory = std::function<std::unique_ptr<ProgressSink>()>;
