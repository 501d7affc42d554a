#include "sync/note_codec.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

namespace vellum::sync {

namespace {

Result<Note, Error> format_error(const std::string& id, const std::string& what) {
    return Result<Note, Error>::err(
        Error{ErrorKind::Format, "Note payload " + id + ": " + what});
}

// JSON numbers are doubles; anything we wrote is an exact integer.
bool read_int(const QJsonObject& obj, const QString& key, int64_t& out) {
    const auto value = obj.value(key);
    if (!value.isDouble()) return false;
    const auto i = exact_int64(value.toDouble());
    if (!i) return false;
    out = *i;
    return true;
}

} // namespace

crypto::SecretBytes encode_note(const Note& note) {
    QJsonObject obj;
    obj[QStringLiteral("v")] = NOTE_CODEC_VERSION;
    obj[QStringLiteral("title")] = QString::fromStdString(note.title);
    obj[QStringLiteral("body")] = QString::fromStdString(note.body);
    obj[QStringLiteral("created")] = static_cast<qint64>(note.created_at.millis());
    obj[QStringLiteral("modified")] = static_cast<qint64>(note.modified_at.millis());
    obj[QStringLiteral("version")] = static_cast<qint64>(note.version);

    QByteArray json = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    crypto::SecretBytes out(reinterpret_cast<const uint8_t*>(json.constData()),
                            static_cast<size_t>(json.size()));
    json.fill('\0');
    return out;
}

Result<Note, Error> decode_note(std::span<const uint8_t> payload, const std::string& id) {
    const auto raw = QByteArray::fromRawData(reinterpret_cast<const char*>(payload.data()),
                                             static_cast<qsizetype>(payload.size()));
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(raw, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return format_error(id, "not a JSON object");
    }
    const auto obj = doc.object();

    int64_t version_tag = 0;
    if (!read_int(obj, QStringLiteral("v"), version_tag) || version_tag < 1) {
        return format_error(id, "missing codec version");
    }
    if (version_tag > NOTE_CODEC_VERSION) {
        return format_error(id, "unsupported codec version " + std::to_string(version_tag));
    }

    const auto title = obj.value(QStringLiteral("title"));
    const auto body = obj.value(QStringLiteral("body"));
    if (!title.isString() || !body.isString()) {
        return format_error(id, "title and body must be strings");
    }

    int64_t modified = 0;
    int64_t version = 0;
    if (!read_int(obj, QStringLiteral("modified"), modified)) {
        return format_error(id, "missing modified timestamp");
    }
    if (!read_int(obj, QStringLiteral("version"), version) || version < 1) {
        return format_error(id, "missing or invalid version counter");
    }

    int64_t created = modified;
    if (version_tag >= 2 && !read_int(obj, QStringLiteral("created"), created)) {
        return format_error(id, "missing created timestamp");
    }

    return Result<Note, Error>::ok(Note{
        .id = id,
        .title = title.toString().toStdString(),
        .body = body.toString().toStdString(),
        .created_at = Timestamp(created),
        .modified_at = Timestamp(modified),
        .version = static_cast<uint64_t>(version),
        .deleted = false
    });
}

} // namespace vellum::sync
