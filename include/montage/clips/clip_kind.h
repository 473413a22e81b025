#pragma once

#include <QString>

#include <optional>

namespace montage {

// Concrete clip type, fixed at construction
enum class ClipKind {
    Video,
    Audio,
    Image,
    Text,
    Caption,
    Shape,
    Composed
};

QString clipKindToString(ClipKind kind);
std::optional<ClipKind> clipKindFromString(const QString& name);

} // namespace montage
