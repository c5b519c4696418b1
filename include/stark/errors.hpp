#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace zkrv {

enum class KeygenErrorKind {
    WidthMismatch,
    BusArityMismatch,
    DegreeTooHigh,
    EmptyAir,
};

/**
 * Inconsistent AIR declarations detected while fixing the proving key.
 */
class KeygenError : public std::runtime_error {
public:
    KeygenError(KeygenErrorKind kind, const std::string& air_name, const std::string& detail)
        : std::runtime_error("keygen error [" + air_name + "]: " + detail),
          kind_(kind), air_name_(air_name) {}

    KeygenErrorKind kind() const { return kind_; }
    const std::string& air_name() const { return air_name_; }

private:
    KeygenErrorKind kind_;
    std::string air_name_;
};

enum class ProverErrorKind {
    TraceShapeMismatch,
    InvalidInput,
};

class ProverError : public std::runtime_error {
public:
    ProverError(ProverErrorKind kind, const std::string& detail)
        : std::runtime_error("prover error: " + detail), kind_(kind) {}

    ProverErrorKind kind() const { return kind_; }

private:
    ProverErrorKind kind_;
};

enum class VerificationErrorKind {
    InvalidProofShape,
    InvalidOpeningArgument,
    OodEvaluationMismatch,
    NonZeroCumulativeSum,
    ChallengePhaseError,
    InvalidProofOfWork,
    MissingAir,
};

inline const char* to_string(VerificationErrorKind kind);

/**
 * VerificationError - discriminated verifier failure
 *
 * Carries the failure class and, where one is known, the name of the AIR
 * whose check failed.
 */
class VerificationError : public std::runtime_error {
public:
    VerificationError(VerificationErrorKind kind, const std::string& detail,
                      std::optional<std::string> air_name = std::nullopt)
        : std::runtime_error(format(kind, detail, air_name)),
          kind_(kind), air_name_(std::move(air_name)) {}

    VerificationErrorKind kind() const { return kind_; }
    const std::optional<std::string>& air_name() const { return air_name_; }

private:
    VerificationErrorKind kind_;
    std::optional<std::string> air_name_;

    static std::string format(VerificationErrorKind kind, const std::string& detail,
                              const std::optional<std::string>& air_name) {
        std::string msg = std::string("verification failed: ") + to_string(kind);
        if (air_name) {
            msg += " [" + *air_name + "]";
        }
        if (!detail.empty()) {
            msg += ": " + detail;
        }
        return msg;
    }
};

inline const char* to_string(VerificationErrorKind kind) {
    switch (kind) {
        case VerificationErrorKind::InvalidProofShape: return "InvalidProofShape";
        case VerificationErrorKind::InvalidOpeningArgument: return "InvalidOpeningArgument";
        case VerificationErrorKind::OodEvaluationMismatch: return "OodEvaluationMismatch";
        case VerificationErrorKind::NonZeroCumulativeSum: return "NonZeroCumulativeSum";
        case VerificationErrorKind::ChallengePhaseError: return "ChallengePhaseError";
        case VerificationErrorKind::InvalidProofOfWork: return "InvalidProofOfWork";
        case VerificationErrorKind::MissingAir: return "MissingAir";
    }
    return "Unknown";
}

} // namespace zkrv
