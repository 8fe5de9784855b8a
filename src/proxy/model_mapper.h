#pragma once
#include "registry/provider.h"
#include "semantic/types.h"
#include <QByteArray>
#include <QJsonObject>
#include <QString>

enum class ModelVendor : quint8 {
    Claude, OpenAi, Gemini, Llama, Qwen, Mistral, DeepSeek, Grok,
    Phi, Gemma, Glm, Kimi, Yi, Command, Jamba, Other
};

namespace model_mapper {

ModelVendor detectVendor(const QString& modelId);
// Unrecognised request models accept any target.
bool sameVendor(const QString& requested, const QString& candidate);

bool thinkingEnabled(const QJsonObject& body);

// Never crosses vendors, and keeps a Claude haiku/sonnet/opus request on
// the same tier when the target names one.
QString mapModel(const ModelMapping& mapping, const QString& requested, bool thinking);

// gpt-4o-2024-08-06 -> gpt-4o, gpt-4-0613 -> gpt-4. Other names pass through.
QString stripGptDate(const QString& model);

// Rewrites the body's "model" for one provider; returns the input untouched
// when nothing changes.
QByteArray applyToBody(const QByteArray& body, const ModelMapping& mapping, AppFamily family);
// Gemini carries the model in the path: /v1beta/models/<model>:generateContent
QString applyToPath(const QString& path, const ModelMapping& mapping);

}
