/**
 * @file outcome.cpp
 * @brief Outcome implementation for the Portainer C++ SDK
 */

#include "portainer/outcome.hpp"
#include "portainer/errors.hpp"

namespace portainer {

std::string outcome_kind_to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Json: return "json";
        case OutcomeKind::Text: return "text";
        case OutcomeKind::Empty: return "empty";
        case OutcomeKind::Failure: return "failure";
        default: return "unknown";
    }
}

Outcome Outcome::json_payload(json payload) {
    Outcome outcome(OutcomeKind::Json);
    outcome.payload_ = std::move(payload);
    return outcome;
}

Outcome Outcome::text_payload(std::string text) {
    Outcome outcome(OutcomeKind::Text);
    outcome.text_ = std::move(text);
    return outcome;
}

Outcome Outcome::empty() {
    return Outcome(OutcomeKind::Empty);
}

Outcome Outcome::failure(int status_code, std::string message) {
    Outcome outcome(OutcomeKind::Failure);
    outcome.status_code_ = status_code;
    outcome.message_ = std::move(message);
    return outcome;
}

const json& Outcome::payload() const {
    if (kind_ != OutcomeKind::Json) {
        throw ValidationError("Outcome has no JSON payload", "kind", outcome_kind_to_string(kind_));
    }
    return payload_;
}

json& Outcome::payload() {
    if (kind_ != OutcomeKind::Json) {
        throw ValidationError("Outcome has no JSON payload", "kind", outcome_kind_to_string(kind_));
    }
    return payload_;
}

const std::string& Outcome::text() const {
    if (kind_ != OutcomeKind::Text) {
        throw ValidationError("Outcome has no text payload", "kind", outcome_kind_to_string(kind_));
    }
    return text_;
}

std::string Outcome::to_string() const {
    if (ok()) {
        return "Successfully executed action";
    }
    return "Failed executing action because " + message_;
}

} // namespace portainer
