#pragma once
#include <stdexcept>
#include <string>

// Thrown by backends. Transient = worth one retry (network, timeout,
// 5xx, 429). Everything else (4xx, undecodable envelope) is final.
class BackendError : public std::runtime_error {
public:
    BackendError(const std::string& msg, bool transient)
        : std::runtime_error(msg), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

// Abstract translation backend.
// Implementations: OllamaBackend (local inference), RemoteBackend (hosted API).
class ITranslationBackend {
public:
    virtual ~ITranslationBackend() = default;

    // Cheap reachability check; must not block longer than ~1s.
    virtual bool isAvailable() const = 0;

    // Returns the model's raw text answer. Throws BackendError.
    // Called from worker threads: implementations must be thread-safe.
    virtual std::string complete(const std::string& systemPrompt,
                                 const std::string& userPrompt,
                                 int timeoutMs) const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
