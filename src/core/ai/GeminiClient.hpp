#pragma once

#include "IAiProvider.hpp"
#include <QByteArray>
#include <QStringList>
#include <QUrl>

namespace srt {

/// Google Gemini REST client (generateContent).
/// Tries each configured model in order until one answers.
class GeminiClient : public IAiProvider {
public:
    struct Settings {
        QString apiKey;
        QString endpoint;
        QStringList models;
        int timeoutMs = 120000;
    };

    static constexpr const char* MISSING_KEY_MESSAGE = "AI provider API key not configured";
    static constexpr const char* RATE_LIMITED_MESSAGE = "rate limited";

    explicit GeminiClient(const Settings& settings);

    void generateText(const QString& prompt, QObject* context, Callback done) override;

    static QUrl modelUrl(const QString& endpoint, const QString& model);
    static QByteArray requestBody(const QString& prompt);

    /// Extracts candidates[0].content.parts[*].text.
    static bool parseResponse(const QByteArray& body, QString* text, QString* error);

private:
    Settings settings_;
};

} // namespace srt
