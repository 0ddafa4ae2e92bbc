#pragma once

#include <stdexcept>
#include <string>

namespace mtqdesign {

class DesignError : public std::runtime_error {
public:
    explicit DesignError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or unreadable configuration file, malformed JSON, or a missing/invalid field.
class ConfigError : public DesignError {
public:
    explicit ConfigError(const std::string& message) : DesignError(message) {}
};

// The radiative heat-balance solve did not converge. Fatal for the whole optimization run.
class ThermalSolverError : public DesignError {
public:
    explicit ThermalSolverError(const std::string& message) : DesignError(message) {}
};

// Model failure local to one candidate width; the optimizer treats that candidate as infeasible.
class CandidateError : public DesignError {
public:
    explicit CandidateError(const std::string& message) : DesignError(message) {}
};

}  // namespace mtqdesign
