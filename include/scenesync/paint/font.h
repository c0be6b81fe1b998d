#pragma once
#include <optional>
#include <string>
#include <variant>

namespace scenesync::paint {

struct FontSpec {
    std::optional<double> size;
    std::optional<std::string> style;    // "italic", "normal"
    std::optional<std::string> variant;  // "small-caps", "normal"
    std::optional<std::string> weight;   // "bold", "400"
    std::optional<std::string> family;

    // CSS shorthand, e.g. "italic bold 12px Helvetica".
    std::string to_css() const;
};

bool operator==(const FontSpec& a, const FontSpec& b);
bool operator!=(const FontSpec& a, const FontSpec& b);

// A text node's font: absent, a CSS font string, or a structured spec.
using Font = std::variant<std::monostate, std::string, FontSpec>;

// Strings compare by value, specs by their five fields, and a string never
// equals a spec.
bool is_same_font(const Font& a, const Font& b);

std::string font_to_css(const Font& font);

enum class Alignment { Left, Center, Right };

const char* alignment_name(Alignment alignment);

}  // namespace scenesync::paint
