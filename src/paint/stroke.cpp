#include <scenesync/paint/stroke.h>

namespace scenesync::paint {

const char* stroke_cap_name(StrokeCap cap) {
    switch (cap) {
        case StrokeCap::Butt:   return "butt";
        case StrokeCap::Round:  return "round";
        case StrokeCap::Square: return "square";
    }
    return "butt";
}

const char* stroke_join_name(StrokeJoin join) {
    switch (join) {
        case StrokeJoin::Miter: return "miter";
        case StrokeJoin::Round: return "round";
        case StrokeJoin::Bevel: return "bevel";
    }
    return "miter";
}

}  // namespace scenesync::paint
