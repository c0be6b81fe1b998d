#include <scenesync/paint/font.h>

#include <sstream>

namespace scenesync::paint {

std::string FontSpec::to_css() const {
    std::ostringstream oss;
    auto sep = [&oss]() {
        if (oss.tellp() > 0) oss << ' ';
    };
    if (style) { sep(); oss << *style; }
    if (variant) { sep(); oss << *variant; }
    if (weight) { sep(); oss << *weight; }
    if (size) { sep(); oss << *size << "px"; }
    if (family) { sep(); oss << *family; }
    return oss.str();
}

bool operator==(const FontSpec& a, const FontSpec& b) {
    return a.size == b.size &&
           a.style == b.style &&
           a.variant == b.variant &&
           a.weight == b.weight &&
           a.family == b.family;
}

bool operator!=(const FontSpec& a, const FontSpec& b) {
    return !(a == b);
}

bool is_same_font(const Font& a, const Font& b) {
    if (a.index() != b.index()) return false;
    if (std::holds_alternative<std::monostate>(a)) return true;
    if (auto* sa = std::get_if<std::string>(&a)) {
        return *sa == std::get<std::string>(b);
    }
    return std::get<FontSpec>(a) == std::get<FontSpec>(b);
}

std::string font_to_css(const Font& font) {
    if (auto* s = std::get_if<std::string>(&font)) return *s;
    if (auto* spec = std::get_if<FontSpec>(&font)) return spec->to_css();
    return "";
}

const char* alignment_name(Alignment alignment) {
    switch (alignment) {
        case Alignment::Left:   return "left";
        case Alignment::Center: return "center";
        case Alignment::Right:  return "right";
    }
    return "left";
}

}  // namespace scenesync::paint
