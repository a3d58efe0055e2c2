#include "GeminiClient.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <boost/log/trivial.hpp>

namespace srt {

GeminiClient::GeminiClient(const Settings& settings)
    : settings_(settings)
{
}

QUrl GeminiClient::modelUrl(const QString& endpoint, const QString& model)
{
    QString base = endpoint;
    while (base.endsWith('/'))
        base.chop(1);
    return QUrl(base + QStringLiteral("/models/") + model + QStringLiteral(":generateContent"));
}

QByteArray GeminiClient::requestBody(const QString& prompt)
{
    QJsonObject part;
    part["text"] = prompt;

    QJsonObject content;
    content["parts"] = QJsonArray{part};

    QJsonObject root;
    root["contents"] = QJsonArray{content};
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

bool GeminiClient::parseResponse(const QByteArray& body, QString* text, QString* error)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QStringLiteral("malformed AI response");
        return false;
    }

    const QJsonArray candidates = doc.object()["candidates"].toArray();
    if (candidates.isEmpty()) {
        *error = QStringLiteral("no response content from AI provider");
        return false;
    }

    QString out;
    const QJsonArray parts = candidates.first().toObject()["content"].toObject()["parts"].toArray();
    for (const auto& p : parts)
        out += p.toObject()["text"].toString();

    if (out.isEmpty()) {
        *error = QStringLiteral("no response content from AI provider");
        return false;
    }
    *text = out;
    return true;
}

// One request per model; the reply handler either finishes or moves on to
// the next model. Settings are copied so nothing here refers back to the
// client object.
static void attemptModel(QNetworkAccessManager* nam, const GeminiClient::Settings& settings,
                         const QString& prompt, int index, IAiProvider::Callback done)
{
    const QString model = settings.models.at(index);

    QNetworkRequest request(GeminiClient::modelUrl(settings.endpoint, model));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("x-goog-api-key", settings.apiKey.toUtf8());
    request.setTransferTimeout(settings.timeoutMs);

    BOOST_LOG_TRIVIAL(debug) << "[Gemini] Requesting " << model.toStdString();
    QNetworkReply* reply = nam->post(request, GeminiClient::requestBody(prompt));

    QObject::connect(reply, &QNetworkReply::finished, nam,
                     [nam, settings, prompt, index, done, model, reply]() {
        reply->deleteLater();

        AiReply result;
        result.model = model;

        const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (httpStatus == 429) {
            result.error = QString::fromLatin1(GeminiClient::RATE_LIMITED_MESSAGE);
        } else if (reply->error() == QNetworkReply::OperationCanceledError) {
            result.error = QStringLiteral("AI request timed out");
        } else if (reply->error() != QNetworkReply::NoError) {
            result.error = httpStatus > 0
                ? QStringLiteral("AI provider returned HTTP %1").arg(httpStatus)
                : reply->errorString();
        } else {
            QString text, error;
            if (GeminiClient::parseResponse(reply->readAll(), &text, &error))
                result.text = text;
            else
                result.error = error;
        }

        if (result.ok()) {
            done(result);
            return;
        }

        BOOST_LOG_TRIVIAL(warning) << "[Gemini] " << model.toStdString() << " failed: "
                                   << result.error.toStdString();
        if (index + 1 < settings.models.size()) {
            attemptModel(nam, settings, prompt, index + 1, done);
            return;
        }
        done(result);
    });
}

void GeminiClient::generateText(const QString& prompt, QObject* context, Callback done)
{
    if (settings_.apiKey.isEmpty()) {
        done(AiReply::failure(QString::fromLatin1(MISSING_KEY_MESSAGE)));
        return;
    }
    if (settings_.models.isEmpty()) {
        done(AiReply::failure(QStringLiteral("no AI models configured")));
        return;
    }

    auto* nam = new QNetworkAccessManager(context);
    attemptModel(nam, settings_, prompt, 0, std::move(done));
}

} // namespace srt
