/**
 * @file outcome.hpp
 * @brief Uniform result of a Portainer API request
 */

#ifndef PORTAINER_OUTCOME_HPP
#define PORTAINER_OUTCOME_HPP

#include "types.hpp"
#include <string>

namespace portainer {

enum class OutcomeKind {
    Json,
    Text,
    Empty,
    Failure
};

std::string outcome_kind_to_string(OutcomeKind kind);

/**
 * Result of a request that completed a round trip.
 *
 * 4xx/5xx responses are Failure outcomes carrying the raw body as message;
 * they are never thrown.
 */
class Outcome {
public:
    static Outcome json_payload(json payload);
    static Outcome text_payload(std::string text);
    static Outcome empty();
    static Outcome failure(int status_code, std::string message);

    OutcomeKind kind() const { return kind_; }
    bool ok() const { return kind_ != OutcomeKind::Failure; }
    bool is_json() const { return kind_ == OutcomeKind::Json; }
    bool is_text() const { return kind_ == OutcomeKind::Text; }
    bool is_empty() const { return kind_ == OutcomeKind::Empty; }

    /// True for a failure with status 404.
    bool is_not_found() const { return kind_ == OutcomeKind::Failure && status_code_ == 404; }

    /// Decoded JSON payload; throws ValidationError for other kinds.
    const json& payload() const;
    json& payload();

    /// Raw text payload; throws ValidationError for other kinds.
    const std::string& text() const;

    /// Failure message (raw response body), empty for successes.
    const std::string& message() const { return message_; }

    /// HTTP status of a failure, 0 for successes.
    int status_code() const { return status_code_; }

    std::string to_string() const;

private:
    explicit Outcome(OutcomeKind kind) : kind_(kind) {}

    OutcomeKind kind_;
    json payload_;
    std::string text_;
    std::string message_;
    int status_code_ = 0;
};

} // namespace portainer

#endif // PORTAINER_OUTCOME_HPP
