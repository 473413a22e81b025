#include <montage/clips/clip_kind.h>

namespace montage {

QString clipKindToString(ClipKind kind)
{
    switch (kind) {
        case ClipKind::Video:    return QStringLiteral("video");
        case ClipKind::Audio:    return QStringLiteral("audio");
        case ClipKind::Image:    return QStringLiteral("image");
        case ClipKind::Text:     return QStringLiteral("text");
        case ClipKind::Caption:  return QStringLiteral("caption");
        case ClipKind::Shape:    return QStringLiteral("shape");
        case ClipKind::Composed: return QStringLiteral("composed");
    }
    return QStringLiteral("unknown");
}

std::optional<ClipKind> clipKindFromString(const QString& name)
{
    const QString key = name.trimmed().toLower();
    for (ClipKind kind : {ClipKind::Video, ClipKind::Audio, ClipKind::Image, ClipKind::Text,
                          ClipKind::Caption, ClipKind::Shape, ClipKind::Composed}) {
        if (clipKindToString(kind) == key) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace montage
