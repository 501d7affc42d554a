#include "sync/envelope_json.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace vellum::sync {

namespace {

QString to_base64(const std::vector<uint8_t>& bytes) {
    const auto raw = QByteArray::fromRawData(reinterpret_cast<const char*>(bytes.data()),
                                             static_cast<qsizetype>(bytes.size()));
    return QString::fromLatin1(raw.toBase64());
}

bool from_base64(const QJsonObject& obj, const QString& key, std::vector<uint8_t>& out) {
    const auto value = obj.value(key);
    if (!value.isString()) return false;
    const auto decoded = QByteArray::fromBase64Encoding(
        value.toString().toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) return false;
    out.assign(decoded->begin(), decoded->end());
    return true;
}

Result<EncryptedEnvelope, Error> format_error(const QString& id, const std::string& what) {
    return Result<EncryptedEnvelope, Error>::err(
        Error{ErrorKind::Format, "Envelope " + id.toStdString() + ": " + what});
}

} // namespace

QJsonObject envelope_to_json(const EncryptedEnvelope& envelope) {
    QJsonObject obj;
    obj[QStringLiteral("id")] = QString::fromStdString(envelope.id);
    obj[QStringLiteral("modified_at")] = static_cast<qint64>(envelope.modified_at.millis());
    obj[QStringLiteral("deleted")] = envelope.deleted;
    if (!envelope.deleted) {
        obj[QStringLiteral("ciphertext")] = to_base64(envelope.ciphertext);
        obj[QStringLiteral("nonce")] = to_base64(envelope.nonce);
        obj[QStringLiteral("tag")] = to_base64(envelope.tag);
    }
    return obj;
}

Result<EncryptedEnvelope, Error> envelope_from_json(const QJsonObject& obj) {
    const auto id = obj.value(QStringLiteral("id")).toString();
    if (id.isEmpty()) {
        return format_error(id, "missing id");
    }

    const auto modified = obj.value(QStringLiteral("modified_at"));
    if (!modified.isDouble()) {
        return format_error(id, "missing modified_at");
    }
    const auto millis = exact_int64(modified.toDouble());
    if (!millis) {
        return format_error(id, "modified_at is not an integer millisecond count");
    }

    EncryptedEnvelope envelope;
    envelope.id = id.toStdString();
    envelope.modified_at = Timestamp(*millis);
    envelope.deleted = obj.value(QStringLiteral("deleted")).toBool(false);
    if (envelope.deleted) {
        return Result<EncryptedEnvelope, Error>::ok(std::move(envelope));
    }

    if (!from_base64(obj, QStringLiteral("ciphertext"), envelope.ciphertext) ||
        !from_base64(obj, QStringLiteral("nonce"), envelope.nonce) ||
        !from_base64(obj, QStringLiteral("tag"), envelope.tag)) {
        return format_error(id, "invalid base64 field");
    }
    return Result<EncryptedEnvelope, Error>::ok(std::move(envelope));
}

Result<PullResponse, Error> parse_pull_response(const QByteArray& body) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<PullResponse, Error>::err(Error{
            ErrorKind::Format, "Pull response is not JSON: " + parse_error.errorString().toStdString()});
    }

    QJsonArray entries;
    if (doc.isArray()) {
        entries = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("notes")).isArray()) {
        entries = doc.object().value(QStringLiteral("notes")).toArray();
    } else {
        return Result<PullResponse, Error>::err(
            Error{ErrorKind::Format, "Pull response has no note list"});
    }

    PullResponse response;
    for (const auto& entry : entries) {
        const auto obj = entry.toObject();
        auto parsed = envelope_from_json(obj);
        if (parsed.is_ok()) {
            response.envelopes.push_back(std::move(parsed).unwrap());
            continue;
        }
        const auto id = obj.value(QStringLiteral("id")).toString();
        if (id.isEmpty()) {
            ++response.dropped;
            continue;
        }
        EncryptedEnvelope damaged;
        damaged.id = id.toStdString();
        damaged.modified_at = Timestamp(
            exact_int64(obj.value(QStringLiteral("modified_at")).toDouble(0)).value_or(0));
        response.envelopes.push_back(std::move(damaged));
    }
    return Result<PullResponse, Error>::ok(std::move(response));
}

} // namespace vellum::sync
