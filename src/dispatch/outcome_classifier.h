#pragma once
#include "semantic/ports.h"
#include <optional>

namespace outcome_classifier {

// Maps an upstream reply to the failure taxonomy; nullopt for success.
std::optional<DomainFailure> classify(const ProviderResponse& response);

bool looksOverloaded(const QByteArray& body);

// error.message, message, or the head of the body.
QString extractErrorMessage(const QByteArray& body);

}
