#pragma once
#include <memory>
#include <optional>
#include <vector>

namespace scenesync::paint {

enum class StrokeCap { Butt, Round, Square };
enum class StrokeJoin { Miter, Round, Bevel };

const char* stroke_cap_name(StrokeCap cap);
const char* stroke_join_name(StrokeJoin join);

// Dash patterns are shared and compared by identity.
using DashPattern = std::shared_ptr<const std::vector<double>>;

inline DashPattern make_dash(std::vector<double> lengths) {
    return std::make_shared<const std::vector<double>>(std::move(lengths));
}

}  // namespace scenesync::paint
