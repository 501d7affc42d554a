#include "core/types.hpp"

#include <QByteArray>
#include <QUuid>
#include <algorithm>

namespace vellum {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

Uuid Uuid::generate() {
    const QByteArray raw = QUuid::createUuid().toRfc4122();
    Bytes bytes{};
    std::transform(raw.cbegin(), raw.cend(), bytes.begin(),
                   [](char c) { return static_cast<uint8_t>(c); });
    return Uuid(bytes);
}

} // namespace vellum
