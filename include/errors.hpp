#pragma once

#include <stdexcept>
#include <string>

namespace livedet {

// Malformed negotiation input. Rejected before a connection exists.
class InvalidOfferError : public std::runtime_error {
public:
    explicit InvalidOfferError(const std::string& what) : std::runtime_error(what) {}
};

// Link or negotiation failure. Only ever seen inside the transport adapter
// and the connection; callers observe it as a state change.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// A single frame failed inside the detector.
class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
};

// A model source could not produce a detector.
class ModelUnavailableError : public std::runtime_error {
public:
    explicit ModelUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace livedet
