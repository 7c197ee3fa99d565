#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace memoria {

// Vector length mismatch in a similarity computation.
class DimensionMismatch : public std::runtime_error {
public:
    DimensionMismatch(size_t lhs, size_t rhs)
        : std::runtime_error("dimension mismatch: " + std::to_string(lhs) +
                             " vs " + std::to_string(rhs)),
          lhs_(lhs), rhs_(rhs) {}

    size_t lhs() const { return lhs_; }
    size_t rhs() const { return rhs_; }

private:
    size_t lhs_;
    size_t rhs_;
};

// An external call (embedder, LLM, store) failed or timed out.
class CollaboratorUnavailable : public std::runtime_error {
public:
    CollaboratorUnavailable(const std::string& collaborator, const std::string& detail)
        : std::runtime_error(collaborator + " unavailable: " + detail),
          collaborator_(collaborator) {}

    const std::string& collaborator() const { return collaborator_; }

private:
    std::string collaborator_;
};

// Raised by MemoryStore backends when the underlying storage fails.
class StoreError : public CollaboratorUnavailable {
public:
    explicit StoreError(const std::string& detail)
        : CollaboratorUnavailable("store", detail) {}
};

// Fact extraction returned something that is not a JSON array of facts.
class ExtractionParseFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace memoria
