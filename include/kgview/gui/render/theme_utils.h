#pragma once

#include <kgview/graph/render/color_palette.h>

namespace kgview {
namespace ThemeUtils {

void applyDarkTheme();
void applyWhiteTheme();
void setTheme(ThemeType theme);

} // namespace ThemeUtils
} // namespace kgview
