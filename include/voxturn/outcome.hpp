#ifndef VOXTURN_OUTCOME_HPP
#define VOXTURN_OUTCOME_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace voxturn {

enum class ErrorKind {
    None,
    Transport,
    Transcription,
    Generation,
    Synthesis,
    Validation,
    Protocol,
    Internal
};

// Stable lowercase name used in outbound messages
const char* errorKindName(ErrorKind kind);

// Thrown by external-call adapters. Converted into an error Outcome
// before it reaches the orchestrator loop.
class ExternalCallError : public std::runtime_error {
public:
    ExternalCallError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Result of one pull from a lazy sequence or one external call.
template <typename T>
class Outcome {
public:
    enum class Status { Value, EndOfStream, Cancelled, Error };

    static Outcome value(T v) {
        Outcome o(Status::Value);
        o.value_ = std::move(v);
        return o;
    }
    static Outcome endOfStream() { return Outcome(Status::EndOfStream); }
    static Outcome cancelled(std::string reason) {
        Outcome o(Status::Cancelled);
        o.detail_ = std::move(reason);
        return o;
    }
    static Outcome error(ErrorKind kind, std::string detail) {
        Outcome o(Status::Error);
        o.kind_ = kind;
        o.detail_ = std::move(detail);
        return o;
    }

    Status status() const { return status_; }
    bool hasValue() const { return status_ == Status::Value; }
    bool isEnd() const { return status_ == Status::EndOfStream; }
    bool isCancelled() const { return status_ == Status::Cancelled; }
    bool isError() const { return status_ == Status::Error; }

    T& get() { return *value_; }
    const T& get() const { return *value_; }
    T take() { return std::move(*value_); }

    ErrorKind errorKind() const { return kind_; }
    // Cancellation reason or error detail
    const std::string& detail() const { return detail_; }

    // Re-tag a non-value outcome for a different payload type
    template <typename U>
    Outcome<U> forward() const {
        switch (status_) {
            case Status::EndOfStream: return Outcome<U>::endOfStream();
            case Status::Cancelled: return Outcome<U>::cancelled(detail_);
            case Status::Error: return Outcome<U>::error(kind_, detail_);
            case Status::Value: break;
        }
        return Outcome<U>::error(ErrorKind::Internal, "forward() called on a value outcome");
    }

private:
    explicit Outcome(Status s) : status_(s) {}

    Status status_;
    std::optional<T> value_;
    ErrorKind kind_{ErrorKind::None};
    std::string detail_;
};

} // namespace voxturn

#endif // VOXTURN_OUTCOME_HPP
