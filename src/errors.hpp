#pragma once
#include <stdexcept>
#include <string>

namespace graphmem {

// Base for all domain errors surfaced by the memory and simulation services.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A durable write was required but the graph store cannot be reached.
class StorageUnavailableError : public Error {
public:
    using Error::Error;
};

// Consolidation requested for a session with no live short-term messages.
class NoMessagesError : public Error {
public:
    explicit NoMessagesError(const std::string& session_id)
        : Error("No live short-term messages for session " + session_id) {}
};

// Unknown job or session identifier.
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Operation not valid for the job's current status.
class InvalidStateError : public Error {
public:
    using Error::Error;
};

class AlreadyCommittedError : public Error {
public:
    explicit AlreadyCommittedError(const std::string& job_id)
        : Error("Simulation job " + job_id + " was already committed") {}
};

// Text-completion failure. Transient errors (timeouts, 5xx, rate limits)
// may be retried; permanent ones (bad request, unknown model) may not.
class GeneratorError : public Error {
public:
    GeneratorError(const std::string& what, bool transient)
        : Error(what), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

} // namespace graphmem
